#include <stagehand/python/nb_base.h>
#include <stagehand/util/errors.h>

#include <cstdint>

namespace stagehand::python {
    Value from_python(nb::handle object) {
        if (object.is_none()) { return Value{}; }
        // bool before int, Python bools are ints
        if (nb::isinstance<nb::bool_>(object)) { return Value{nb::cast<bool>(object)}; }
        if (nb::isinstance<nb::int_>(object)) { return Value{static_cast<double>(nb::cast<std::int64_t>(object))}; }
        if (nb::isinstance<nb::float_>(object)) { return Value{nb::cast<double>(object)}; }
        if (nb::isinstance<nb::str>(object)) { return Value{nb::cast<std::string>(object)}; }
        if (nb::isinstance<Rgba>(object)) { return Value{nb::cast<Rgba>(object)}; }
        if (nb::isinstance<Asset>(object)) { return Value{nb::cast<Asset>(object)}; }
        if (nb::isinstance<nb::dict>(object)) {
            ValueMap map;
            for (auto [key, item] : nb::borrow<nb::dict>(object)) {
                map.set(nb::cast<std::string>(nb::str(key)), from_python(item));
            }
            return Value{std::move(map)};
        }
        if (nb::isinstance<nb::list>(object) || nb::isinstance<nb::tuple>(object)) {
            ValueList list;
            for (nb::handle item : object) { list.push_back(from_python(item)); }
            return Value{std::move(list)};
        }
        throw_error<InvalidArgument>("Cannot convert a Python {} to a value",
                                     nb::cast<std::string>(nb::str(object.type())));
    }

    nb::object to_python(const Value &value) {
        switch (value.kind()) {
            case Value::Kind::undefined: return nb::none();
            case Value::Kind::boolean: return nb::bool_(value.as_bool());
            case Value::Kind::number: return nb::float_(value.as_number());
            case Value::Kind::string: return nb::str(value.as_string().c_str());
            case Value::Kind::rgba: return nb::cast(value.as_rgba());
            case Value::Kind::asset: return nb::cast(value.as_asset());
            case Value::Kind::map: {
                nb::dict result;
                for (const auto &[key, item] : value.as_map()) { result[key.c_str()] = to_python(item); }
                return std::move(result);
            }
            case Value::Kind::list: {
                nb::list result;
                for (const auto &item : value.as_list()) { result.append(to_python(item)); }
                return std::move(result);
            }
        }
        return nb::none();
    }

    ShorthandProp shorthand_from_python(nb::handle object) {
        if (nb::isinstance<PropTypeConfig>(object)) { return ShorthandProp{nb::cast<PropTypeConfig>(object)}; }
        if (nb::isinstance<nb::dict>(object)) {
            ShorthandProps props;
            for (auto [key, item] : nb::borrow<nb::dict>(object)) {
                props.emplace_back(nb::cast<std::string>(nb::str(key)), shorthand_from_python(item));
            }
            return ShorthandProp{types::compound(std::move(props))};
        }
        return ShorthandProp::from_value(from_python(object));
    }
} // namespace stagehand::python
