#include <stagehand/reactive/atom.h>
#include <stagehand/reactive/prism.h>
#include <stagehand/util/errors.h>

#include <catch2/catch_test_macros.hpp>

using namespace stagehand;

namespace {

Value scene() {
    return ValueMap{{"position", ValueMap{{"x", 1.0}, {"y", 2.0}}},
                    {"points", ValueList{Value{10.0}, Value{20.0}}}};
}

}  // namespace

TEST_CASE("Pointer - indexing builds paths", "[reactive][pointer]") {
    auto atom = Atom::create(scene());
    auto root = atom->pointer();

    REQUIRE_FALSE(root.is_null());
    REQUIRE(root.path().empty());
    REQUIRE(root.atom_id() == atom->id());

    auto x = root["position"]["x"];
    REQUIRE(x.path() == PropPath{"position", "x"});
    REQUIRE(val(x).as_number() == 1.0);

    auto second = root["points"][std::size_t{1}];
    REQUIRE(val(second).as_number() == 20.0);

    REQUIRE(x == atom->pointer()["position"]["x"]);
    REQUIRE_FALSE(x == root["position"]["y"]);
}

TEST_CASE("Pointer - missing paths and dead atoms resolve to undefined", "[reactive][pointer]") {
    Pointer dangling;
    {
        auto atom = Atom::create(scene());
        REQUIRE(val(atom->pointer()["nope"]["deeper"]).is_undefined());
        dangling = atom->pointer()["position"];
        REQUIRE(val(dangling).is_map());
    }
    REQUIRE(val(dangling).is_undefined());
    REQUIRE_FALSE(dangling.is_null());
    REQUIRE(Pointer{}.is_null());
}

TEST_CASE("Prism - pointer prisms follow the atom", "[reactive][prism]") {
    auto atom = Atom::create(scene());
    auto prism = pointer_to_prism(atom->pointer()["position"]["x"]);

    REQUIRE(val(prism).as_number() == 1.0);
    atom->set_by_path({"position", "x"}, 4.0);
    REQUIRE(val(prism).as_number() == 4.0);

    REQUIRE(prism.dependencies().size() == 1);
    REQUIRE(prism.dependencies()[0].atom_id == atom->id());
    REQUIRE(prism.dependencies()[0].path == PropPath{"position", "x"});
}

TEST_CASE("Prism - map and combine", "[reactive][prism]") {
    auto atom = Atom::create(scene());
    auto x = pointer_to_prism(atom->pointer()["position"]["x"]);
    auto y = pointer_to_prism(atom->pointer()["position"]["y"]);

    auto doubled = x.map([](const Value& v) { return Value{v.as_number() * 2.0}; });
    REQUIRE(val(doubled).as_number() == 2.0);
    REQUIRE(doubled.dependencies().size() == 1);

    auto sum = Prism::combine({x, y}, [](const std::vector<Value>& values) {
        return Value{values[0].as_number() + values[1].as_number()};
    });
    REQUIRE(val(sum).as_number() == 3.0);
    REQUIRE(sum.dependencies().size() == 2);

    atom->set_by_path({"position", "y"}, 7.0);
    REQUIRE(val(sum).as_number() == 8.0);
}

TEST_CASE("Prism - empty prisms and null pointers are rejected", "[reactive][prism]") {
    Prism empty;
    REQUIRE(empty.empty());
    REQUIRE(empty.dependencies().empty());

    REQUIRE_THROWS_AS(empty.get(), InvalidArgument);
    REQUIRE_THROWS_AS(empty.map([](const Value& v) { return v; }), InvalidArgument);
    REQUIRE_THROWS_AS(pointer_to_prism(Pointer{}), InvalidArgument);
    REQUIRE_THROWS_AS(to_prism(Observable{empty}), InvalidArgument);
    REQUIRE_THROWS_AS(Prism({}, Prism::compute_fn{}), InvalidArgument);
}

TEST_CASE("Prism - observables convert to prisms", "[reactive][prism]") {
    auto atom = Atom::create(scene());
    Observable from_pointer = atom->pointer()["position"]["y"];
    REQUIRE(val(to_prism(from_pointer)).as_number() == 2.0);

    Observable from_prism = pointer_to_prism(atom->pointer()["position"]["x"]);
    REQUIRE(val(to_prism(from_prism)).as_number() == 1.0);
}
