#include <stagehand/util/errors.h>
#include <stagehand/value/path.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace stagehand {

const std::string& PathKey::name() const {
    if (!is_field()) {
        throw_error<InvalidArgument>("PathKey {} is not a field key", to_string());
    }
    return std::get<std::string>(_data);
}

std::size_t PathKey::get_index() const {
    if (!is_index()) {
        throw_error<InvalidArgument>("PathKey '{}' is not an index key", std::get<std::string>(_data));
    }
    return std::get<std::size_t>(_data);
}

std::string PathKey::to_string() const {
    if (is_field()) {
        return std::get<std::string>(_data);
    }
    return fmt::format("[{}]", std::get<std::size_t>(_data));
}

bool is_prefix(const PropPath& prefix, const PropPath& path) {
    if (prefix.size() > path.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), path.begin());
}

bool paths_intersect(const PropPath& a, const PropPath& b) {
    return a.size() <= b.size() ? is_prefix(a, b) : is_prefix(b, a);
}

std::string to_string(const PropPath& path) {
    std::string result;
    for (const auto& key : path) {
        if (key.is_field()) {
            if (!result.empty()) {
                result += '.';
            }
            result += key.name();
        } else {
            result += key.to_string();
        }
    }
    return result;
}

// ============================================================================
// Readable form
// ============================================================================

namespace {

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '-';
}

std::size_t parse_index(std::string_view text, std::string_view whole) {
    std::size_t value{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        throw_error<InvalidArgument>("Invalid path '{}': '{}' is not a valid index", whole, text);
    }
    return value;
}

}  // namespace

PropPath parse_prop_path(std::string_view text) {
    PropPath path;
    if (text.empty()) {
        return path;
    }
    if (text.front() == '.') {
        throw_error<InvalidArgument>("Invalid path '{}': leading dot", text);
    }

    std::size_t pos = 0;
    const std::size_t len = text.size();
    while (pos < len) {
        if (text[pos] == '.') {
            ++pos;
            if (pos >= len) {
                throw_error<InvalidArgument>("Invalid path '{}': trailing dot", text);
            }
            if (text[pos] == '.') {
                throw_error<InvalidArgument>("Invalid path '{}': consecutive dots", text);
            }
        }

        if (text[pos] == '[') {
            auto close = text.find(']', pos);
            if (close == std::string_view::npos) {
                throw_error<InvalidArgument>("Invalid path '{}': unterminated bracket", text);
            }
            auto inner = text.substr(pos + 1, close - pos - 1);
            if (inner.size() >= 2 && (inner.front() == '"' || inner.front() == '\'') && inner.back() == inner.front()) {
                path.emplace_back(std::string{inner.substr(1, inner.size() - 2)});
            } else {
                path.emplace_back(parse_index(inner, text));
            }
            pos = close + 1;
            continue;
        }

        auto start = pos;
        while (pos < len && is_identifier_char(text[pos])) {
            ++pos;
        }
        if (start == pos) {
            throw_error<InvalidArgument>("Invalid path '{}': unexpected character '{}'", text, text[pos]);
        }
        path.emplace_back(std::string{text.substr(start, pos - start)});
    }
    return path;
}

// ============================================================================
// Encoded (JSON array) form
// ============================================================================

namespace {

void append_json_string(std::string& out, const std::string& value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c;
        }
    }
    out += '"';
}

class EncodedPathReader {
public:
    explicit EncodedPathReader(std::string_view text) : _text(text) {}

    PropPath read() {
        skip_ws();
        expect('[');
        PropPath path;
        skip_ws();
        if (peek() == ']') {
            ++_pos;
            finish();
            return path;
        }
        while (true) {
            skip_ws();
            if (peek() == '"') {
                path.emplace_back(read_string());
            } else {
                path.emplace_back(read_index());
            }
            skip_ws();
            if (peek() == ',') {
                ++_pos;
                continue;
            }
            expect(']');
            break;
        }
        finish();
        return path;
    }

private:
    [[noreturn]] void fail(std::string_view what) const {
        throw_error<InvalidArgument>("Malformed encoded path '{}': {} at offset {}", _text, what, _pos);
    }

    char peek() const { return _pos < _text.size() ? _text[_pos] : '\0'; }

    void skip_ws() {
        while (_pos < _text.size() && std::isspace(static_cast<unsigned char>(_text[_pos]))) {
            ++_pos;
        }
    }

    void expect(char c) {
        if (peek() != c) {
            fail(fmt::format("expected '{}'", c));
        }
        ++_pos;
    }

    void finish() {
        skip_ws();
        if (_pos != _text.size()) {
            fail("trailing characters");
        }
    }

    std::string read_string() {
        expect('"');
        std::string out;
        while (true) {
            if (_pos >= _text.size()) {
                fail("unterminated string");
            }
            char c = _text[_pos++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (_pos >= _text.size()) {
                fail("unterminated escape");
            }
            char e = _text[_pos++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                default: fail(fmt::format("unsupported escape '\\{}'", e));
            }
        }
    }

    std::size_t read_index() {
        auto start = _pos;
        while (_pos < _text.size() && std::isdigit(static_cast<unsigned char>(_text[_pos]))) {
            ++_pos;
        }
        if (start == _pos) {
            fail("expected a string or a non-negative integer");
        }
        std::size_t value{0};
        std::from_chars(_text.data() + start, _text.data() + _pos, value);
        return value;
    }

    std::string_view _text;
    std::size_t _pos{0};
};

}  // namespace

PathToPropEncoded encode_path_to_prop(const PropPath& path) {
    std::string out{"["};
    bool first = true;
    for (const auto& key : path) {
        if (!first) {
            out += ',';
        }
        first = false;
        if (key.is_field()) {
            append_json_string(out, key.name());
        } else {
            out += std::to_string(key.get_index());
        }
    }
    out += ']';
    return PathToPropEncoded{std::move(out)};
}

PropPath decode_path_to_prop(const PathToPropEncoded& encoded) {
    return EncodedPathReader{encoded.str()}.read();
}

}  // namespace stagehand
