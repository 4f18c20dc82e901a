#include <stagehand/python/nb_base.h>
#include <stagehand/reactive/atom.h>
#include <stagehand/reactive/prism.h>
#include <stagehand/value/path.h>

#include <nanobind/operators.h>

void export_reactive(nb::module_ &m) {
    using namespace stagehand;

    nb::class_<Pointer>(m, "Pointer")
        .def(nb::init<>())
        .def("__getitem__", [](const Pointer &self, const std::string &field) { return self[field]; }, "field"_a)
        .def("__getitem__", [](const Pointer &self, std::size_t index) { return self[index]; }, "index"_a)
        .def_prop_ro("path", [](const Pointer &self) { return to_string(self.path()); })
        .def_prop_ro("is_null", &Pointer::is_null)
        .def("value", [](const Pointer &self) { return python::to_python(self.resolve()); })
        .def(nb::self == nb::self)
        .def("__repr__", [](const Pointer &self) { return "Pointer(" + to_string(self.path()) + ")"; });

    nb::class_<Prism>(m, "Prism")
        .def_prop_ro("empty", &Prism::empty)
        .def("value", [](const Prism &self) { return python::to_python(self.get()); })
        .def("map", [](const Prism &self, nb::callable fn) {
            return self.map([fn](const Value &value) { return python::from_python(fn(python::to_python(value))); });
        }, "fn"_a);

    m.def("pointer_to_prism", &pointer_to_prism, "pointer"_a);

    m.def("combine", [](std::vector<Prism> prisms, nb::callable fn) {
        return Prism::combine(std::move(prisms), [fn](const std::vector<Value> &values) {
            nb::list args;
            for (const auto &value : values) { args.append(python::to_python(value)); }
            return python::from_python(fn(args));
        });
    }, "prisms"_a, "fn"_a);

    nb::class_<Atom>(m, "Atom")
        .def_static("create", [](nb::handle initial) { return Atom::create(python::from_python(initial)); },
                    "initial"_a = nb::none())
        .def_prop_ro("id", &Atom::id)
        .def("get", [](const Atom &self) { return python::to_python(self.get()); })
        .def("set", [](Atom &self, nb::handle value) { self.set(python::from_python(value)); }, "value"_a)
        .def("set_by_path", [](Atom &self, const std::string &path, nb::handle value) {
            self.set_by_path(parse_prop_path(path), python::from_python(value));
        }, "path"_a, "value"_a)
        .def("pointer", &Atom::pointer);
}
