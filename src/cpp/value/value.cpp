#include <stagehand/util/errors.h>
#include <stagehand/value/value.h>

#include <algorithm>

namespace stagehand {

Value::Value(ValueMap map) : _data(std::make_shared<const ValueMap>(std::move(map))) {}

Value::Value(ValueList list) : _data(std::make_shared<const ValueList>(std::move(list))) {}

std::string_view to_string(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::undefined: return "undefined";
        case Value::Kind::boolean: return "boolean";
        case Value::Kind::number: return "number";
        case Value::Kind::string: return "string";
        case Value::Kind::rgba: return "rgba";
        case Value::Kind::asset: return "asset";
        case Value::Kind::map: return "map";
        case Value::Kind::list: return "list";
    }
    return "unknown";
}

namespace {

[[noreturn]] void kind_mismatch(Value::Kind expected, const Value& actual) {
    throw_error<InvalidArgument>("Expected a value of kind {}, got {} ({})", to_string(expected),
                                 to_string(actual.kind()), actual.to_string());
}

}  // namespace

bool Value::as_bool() const {
    if (!is_bool()) kind_mismatch(Kind::boolean, *this);
    return std::get<bool>(_data);
}

double Value::as_number() const {
    if (!is_number()) kind_mismatch(Kind::number, *this);
    return std::get<double>(_data);
}

const std::string& Value::as_string() const {
    if (!is_string()) kind_mismatch(Kind::string, *this);
    return std::get<std::string>(_data);
}

const Rgba& Value::as_rgba() const {
    if (!is_rgba()) kind_mismatch(Kind::rgba, *this);
    return std::get<Rgba>(_data);
}

const Asset& Value::as_asset() const {
    if (!is_asset()) kind_mismatch(Kind::asset, *this);
    return std::get<Asset>(_data);
}

const ValueMap& Value::as_map() const {
    if (!is_map()) kind_mismatch(Kind::map, *this);
    return *std::get<std::shared_ptr<const ValueMap>>(_data);
}

const ValueList& Value::as_list() const {
    if (!is_list()) kind_mismatch(Kind::list, *this);
    return *std::get<std::shared_ptr<const ValueList>>(_data);
}

const Value* Value::find(std::string_view key) const {
    if (!is_map()) {
        return nullptr;
    }
    return std::get<std::shared_ptr<const ValueMap>>(_data)->find(key);
}

Value Value::at_path(const PropPath& path) const {
    const Value* current = this;
    for (const auto& key : path) {
        if (key.is_field()) {
            current = current->find(key.name());
        } else if (current->is_list()) {
            const auto& list = current->as_list();
            current = key.get_index() < list.size() ? &list[key.get_index()] : nullptr;
        } else {
            current = nullptr;
        }
        if (current == nullptr) {
            return Value{};
        }
    }
    return *current;
}

namespace {

Value with_path_from(const Value& node, const PropPath& path, std::size_t depth, Value value) {
    if (depth == path.size()) {
        return value;
    }
    const auto& key = path[depth];
    if (key.is_field()) {
        ValueMap map = node.is_map() ? node.as_map() : ValueMap{};
        const Value* child = map.find(key.name());
        Value next = with_path_from(child != nullptr ? *child : Value{}, path, depth + 1, std::move(value));
        map.set(key.name(), std::move(next));
        return Value{std::move(map)};
    }

    if (!node.is_list()) {
        throw_error<InvalidArgument>("Cannot write index {} of path '{}': the value there is a {}, not a list",
                                     key.get_index(), path, to_string(node.kind()));
    }
    ValueList list = node.as_list();
    const auto index = key.get_index();
    if (index > list.size()) {
        throw_error<InvalidArgument>("Cannot write index {} of path '{}': the list has {} elements", index, path,
                                     list.size());
    }
    if (index == list.size()) {
        list.push_back(with_path_from(Value{}, path, depth + 1, std::move(value)));
    } else {
        list[index] = with_path_from(list[index], path, depth + 1, std::move(value));
    }
    return Value{std::move(list)};
}

}  // namespace

Value Value::with_path(const PropPath& path, Value value) const {
    return with_path_from(*this, path, 0, std::move(value));
}

bool Value::same(const Value& other) const noexcept {
    if (_data.index() != other._data.index()) {
        return false;
    }
    switch (kind()) {
        case Kind::map:
            return std::get<std::shared_ptr<const ValueMap>>(_data) ==
                   std::get<std::shared_ptr<const ValueMap>>(other._data);
        case Kind::list:
            return std::get<std::shared_ptr<const ValueList>>(_data) ==
                   std::get<std::shared_ptr<const ValueList>>(other._data);
        default:
            return _data == other._data;
    }
}

bool Value::operator==(const Value& other) const {
    if (_data.index() != other._data.index()) {
        return false;
    }
    switch (kind()) {
        case Kind::map: {
            const auto& a = std::get<std::shared_ptr<const ValueMap>>(_data);
            const auto& b = std::get<std::shared_ptr<const ValueMap>>(other._data);
            return a == b || *a == *b;
        }
        case Kind::list: {
            const auto& a = std::get<std::shared_ptr<const ValueList>>(_data);
            const auto& b = std::get<std::shared_ptr<const ValueList>>(other._data);
            return a == b || *a == *b;
        }
        default:
            return _data == other._data;
    }
}

namespace {

void append_quoted(std::string& out, const std::string& text) {
    out += '"';
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
}

void append_value(std::string& out, const Value& value) {
    switch (value.kind()) {
        case Value::Kind::undefined: out += "undefined"; break;
        case Value::Kind::boolean: out += value.as_bool() ? "true" : "false"; break;
        case Value::Kind::number: out += fmt::format("{}", value.as_number()); break;
        case Value::Kind::string: append_quoted(out, value.as_string()); break;
        case Value::Kind::rgba: {
            const auto& c = value.as_rgba();
            out += fmt::format("rgba({}, {}, {}, {})", c.r, c.g, c.b, c.a);
            break;
        }
        case Value::Kind::asset: {
            const auto& asset = value.as_asset();
            out += fmt::format("{}({})", asset.kind == AssetKind::image ? "image" : "file",
                               asset.id ? *asset.id : std::string{"undefined"});
            break;
        }
        case Value::Kind::map: {
            out += '{';
            bool first = true;
            for (const auto& [key, child] : value.as_map()) {
                if (!first) out += ", ";
                first = false;
                append_quoted(out, key);
                out += ": ";
                append_value(out, child);
            }
            out += '}';
            break;
        }
        case Value::Kind::list: {
            out += '[';
            bool first = true;
            for (const auto& child : value.as_list()) {
                if (!first) out += ", ";
                first = false;
                append_value(out, child);
            }
            out += ']';
            break;
        }
    }
}

}  // namespace

std::string Value::to_string() const {
    std::string out;
    append_value(out, *this);
    return out;
}

// ============================================================================
// ValueMap
// ============================================================================

ValueMap::ValueMap(std::initializer_list<entry_type> entries) {
    _entries.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

const Value* ValueMap::find(std::string_view key) const {
    auto it = std::find_if(_entries.begin(), _entries.end(), [key](const entry_type& e) { return e.first == key; });
    return it == _entries.end() ? nullptr : &it->second;
}

void ValueMap::set(std::string key, Value value) {
    auto it = std::find_if(_entries.begin(), _entries.end(), [&key](const entry_type& e) { return e.first == key; });
    if (it != _entries.end()) {
        it->second = std::move(value);
    } else {
        _entries.emplace_back(std::move(key), std::move(value));
    }
}

bool ValueMap::erase(std::string_view key) {
    auto it = std::find_if(_entries.begin(), _entries.end(), [key](const entry_type& e) { return e.first == key; });
    if (it == _entries.end()) {
        return false;
    }
    _entries.erase(it);
    return true;
}

bool ValueMap::operator==(const ValueMap& other) const {
    if (size() != other.size()) {
        return false;
    }
    return std::all_of(_entries.begin(), _entries.end(), [&other](const entry_type& e) {
        const Value* match = other.find(e.first);
        return match != nullptr && *match == e.second;
    });
}

Value deep_merge(const Value& base, const Value& overlay) {
    if (overlay.is_undefined()) {
        return base;
    }
    if (!base.is_map() || !overlay.is_map()) {
        return overlay;
    }
    ValueMap merged = base.as_map();
    for (const auto& [key, value] : overlay.as_map()) {
        const Value* existing = merged.find(key);
        merged.set(key, existing != nullptr ? deep_merge(*existing, value) : value);
    }
    return Value{std::move(merged)};
}

}  // namespace stagehand
