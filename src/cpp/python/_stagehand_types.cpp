#include <stagehand/python/nb_base.h>
#include <stagehand/prop_types/prop_type.h>
#include <stagehand/util/errors.h>

#include <nanobind/operators.h>

void export_types(nb::module_ &m) {
    using namespace stagehand;

    nb::class_<Rgba>(m, "Rgba")
        .def(nb::init<>())
        .def("__init__", [](Rgba *self, double r, double g, double b, double a) { new (self) Rgba{r, g, b, a}; },
             "r"_a, "g"_a, "b"_a, "a"_a = 1.0)
        .def_rw("r", &Rgba::r)
        .def_rw("g", &Rgba::g)
        .def_rw("b", &Rgba::b)
        .def_rw("a", &Rgba::a)
        .def(nb::self == nb::self)
        .def("__repr__", [](const Rgba &self) { return Value{self}.to_string(); });

    nb::enum_<AssetKind>(m, "AssetKind")
        .value("image", AssetKind::image)
        .value("file", AssetKind::file);

    nb::class_<Asset>(m, "Asset")
        .def("__init__", [](Asset *self, AssetKind kind, std::optional<std::string> id) {
            new (self) Asset{kind, std::move(id)};
        }, "kind"_a, "id"_a = nb::none())
        .def_rw("kind", &Asset::kind)
        .def_rw("id", &Asset::id)
        .def(nb::self == nb::self);

    nb::enum_<PropTypeKind>(m, "PropTypeKind")
        .value("number", PropTypeKind::number)
        .value("boolean", PropTypeKind::boolean)
        .value("string", PropTypeKind::string)
        .value("string_literal", PropTypeKind::string_literal)
        .value("rgba", PropTypeKind::rgba)
        .value("image", PropTypeKind::image)
        .value("file", PropTypeKind::file)
        .value("compound", PropTypeKind::compound)
        .value("enumeration", PropTypeKind::enumeration);

    nb::class_<PropTypeConfig>(m, "PropTypeConfig")
        .def_prop_ro("kind", &PropTypeConfig::kind)
        .def_prop_ro("label", &PropTypeConfig::label)
        .def_prop_ro("default", [](const PropTypeConfig &self) { return python::to_python(materialize_default(self)); })
        .def("sanitize", [](const PropTypeConfig &self, nb::handle raw) -> nb::object {
            auto result = sanitize(self, python::from_python(raw));
            return result ? python::to_python(*result) : nb::none();
        }, "raw"_a)
        .def("interpolate", [](const PropTypeConfig &self, nb::handle left, nb::handle right, double progression) {
            return python::to_python(interpolate(self, python::from_python(left), python::from_python(right),
                                                 progression));
        }, "left"_a, "right"_a, "progression"_a)
        .def(nb::self == nb::self);

    auto types_m = m.def_submodule("types", "Prop type builders");

    types_m.def("number", [](double default_value, std::optional<double> min, std::optional<double> max,
                             std::optional<double> nudge_multiplier, std::optional<std::string> label) {
        types::NumberOptions options;
        if (min.has_value() != max.has_value()) {
            throw_error<InvalidArgument>("A number range needs both min and max");
        }
        if (min) { options.range = NumberRange{*min, *max}; }
        options.nudge_multiplier = nudge_multiplier;
        options.label = std::move(label);
        return types::number(default_value, std::move(options));
    }, "default"_a, "min"_a = nb::none(), "max"_a = nb::none(), "nudge_multiplier"_a = nb::none(),
       "label"_a = nb::none());

    types_m.def("boolean", [](bool default_value, std::optional<std::string> label) {
        return types::boolean(default_value, {.label = std::move(label)});
    }, "default"_a, "label"_a = nb::none());

    types_m.def("string", [](std::string default_value, std::optional<std::string> label) {
        return types::string(std::move(default_value), {.label = std::move(label)});
    }, "default"_a, "label"_a = nb::none());

    types_m.def("string_literal", [](std::string default_value, nb::dict values_and_labels,
                                     std::optional<std::string> label) {
        std::vector<std::pair<std::string, std::string>> values;
        for (auto [value, text] : values_and_labels) {
            values.emplace_back(nb::cast<std::string>(value), nb::cast<std::string>(text));
        }
        return types::string_literal(std::move(default_value), std::move(values), {.label = std::move(label)});
    }, "default"_a, "values_and_labels"_a, "label"_a = nb::none());

    types_m.def("rgba", [](Rgba default_value, std::optional<std::string> label) {
        return types::rgba(default_value, {.label = std::move(label)});
    }, "default"_a = Rgba{}, "label"_a = nb::none());

    types_m.def("image", [](std::optional<std::string> default_id, std::optional<std::string> label) {
        return types::image(std::move(default_id), {.label = std::move(label)});
    }, "default"_a = nb::none(), "label"_a = nb::none());

    types_m.def("file", [](std::optional<std::string> default_id, std::optional<std::string> label) {
        return types::file(std::move(default_id), {.label = std::move(label)});
    }, "default"_a = nb::none(), "label"_a = nb::none());

    types_m.def("compound", [](nb::dict props, std::optional<std::string> label) {
        ShorthandProps result;
        for (auto [key, item] : props) {
            result.emplace_back(nb::cast<std::string>(key), python::shorthand_from_python(item));
        }
        return types::compound(std::move(result), {std::move(label)});
    }, "props"_a, "label"_a = nb::none());

    types_m.def("enumeration", [](std::string default_case, nb::dict cases, std::optional<std::string> label) {
        ShorthandProps result;
        for (auto [key, item] : cases) {
            result.emplace_back(nb::cast<std::string>(key), python::shorthand_from_python(item));
        }
        return types::enumeration(std::move(default_case), std::move(result), {std::move(label)});
    }, "default_case"_a, "cases"_a, "label"_a = nb::none());
}
