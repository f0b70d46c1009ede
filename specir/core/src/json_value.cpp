#include "specir/core/json_value.hpp"

#include "specir/core/serde.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace specir::serde {

namespace {

constexpr int kMaxJsonDepth = 512;

struct json_parser {
    json_cursor cur;
    std::string error;

    explicit json_parser(std::string_view text) : cur(text.data(), text.data() + text.size()) {}

    void fail(std::string_view message) {
        if (error.empty()) {
            error = "offset " + std::to_string(cur.pos()) + ": " + std::string(message);
        }
    }

    std::optional<json_value> parse_value(int depth) {
        if (depth > kMaxJsonDepth) {
            fail("nesting too deep");
            return std::nullopt;
        }
        switch (cur.peek()) {
        case '{':
            return parse_object(depth);
        case '[':
            return parse_array(depth);
        case '\"': {
            auto raw = cur.string();
            if (!raw) {
                fail("unterminated string");
                return std::nullopt;
            }
            return json_value::string_value(unescape_json_string(*raw));
        }
        case 't':
            if (cur.consume_literal("true")) {
                return json_value::boolean_value(true);
            }
            break;
        case 'f':
            if (cur.consume_literal("false")) {
                return json_value::boolean_value(false);
            }
            break;
        case 'n':
            if (cur.consume_literal("null")) {
                return json_value::null_value();
            }
            break;
        case '\0':
            fail("unexpected end of input");
            return std::nullopt;
        default:
            return parse_number();
        }
        fail("invalid literal");
        return std::nullopt;
    }

    std::optional<json_value> parse_number() {
        const char* begin = cur.ptr;
        char* endptr = nullptr;
        double v = std::strtod(begin, &endptr);
        if (endptr == begin || endptr > cur.end) {
            fail("invalid number");
            return std::nullopt;
        }
        std::string_view literal(begin, static_cast<size_t>(endptr - begin));
        cur.ptr = endptr;
        std::optional<int64_t> as_integer;
        if (literal.find_first_of(".eE") == std::string_view::npos) {
            int64_t iv = 0;
            auto fc = std::from_chars(literal.data(), literal.data() + literal.size(), iv);
            if (fc.ec == std::errc() && fc.ptr == literal.data() + literal.size()) {
                as_integer = iv;
            }
        }
        return json_value::number_value(v, as_integer);
    }

    std::optional<json_value> parse_object(int depth) {
        cur.try_object_start();
        json_value obj = json_value::object_value();
        if (cur.try_object_end()) {
            return obj;
        }
        while (true) {
            auto key = cur.string();
            if (!key) {
                fail("expected object key");
                return std::nullopt;
            }
            if (!cur.consume(':')) {
                fail("expected ':'");
                return std::nullopt;
            }
            auto value = parse_value(depth + 1);
            if (!value) {
                return std::nullopt;
            }
            obj.set(unescape_json_string(*key), std::move(*value));
            if (cur.try_comma()) {
                continue;
            }
            if (cur.try_object_end()) {
                return obj;
            }
            fail("expected ',' or '}'");
            return std::nullopt;
        }
    }

    std::optional<json_value> parse_array(int depth) {
        cur.try_array_start();
        json_value arr = json_value::array_value();
        if (cur.try_array_end()) {
            return arr;
        }
        while (true) {
            auto value = parse_value(depth + 1);
            if (!value) {
                return std::nullopt;
            }
            arr.push(std::move(*value));
            if (cur.try_comma()) {
                continue;
            }
            if (cur.try_array_end()) {
                return arr;
            }
            fail("expected ',' or ']'");
            return std::nullopt;
        }
    }
};

void write_json(const json_value& v, std::ostringstream& os) {
    switch (v.k) {
    case json_value::kind::null:
        os << "null";
        break;
    case json_value::kind::boolean:
        os << (v.boolean ? "true" : "false");
        break;
    case json_value::kind::number:
        if (v.integer) {
            os << *v.integer;
        } else {
            os << v.number;
        }
        break;
    case json_value::kind::string:
        os << '\"' << escape_json_string(v.str) << '\"';
        break;
    case json_value::kind::object: {
        os << '{';
        bool first = true;
        for (const auto& [key, child] : v.object) {
            if (!first) {
                os << ',';
            }
            first = false;
            os << '\"' << escape_json_string(key) << "\":";
            write_json(*child, os);
        }
        os << '}';
        break;
    }
    case json_value::kind::array: {
        os << '[';
        bool first = true;
        for (const auto& child : v.array) {
            if (!first) {
                os << ',';
            }
            first = false;
            write_json(*child, os);
        }
        os << ']';
        break;
    }
    }
}

} // namespace

const json_value* json_value::find(std::string_view key) const noexcept {
    if (k != kind::object) {
        return nullptr;
    }
    for (const auto& [name, child] : object) {
        if (name == key) {
            return child.get();
        }
    }
    return nullptr;
}

std::optional<std::string_view> json_value::string_at(std::string_view key) const noexcept {
    const json_value* v = find(key);
    if (!v || !v->is_string()) {
        return std::nullopt;
    }
    return std::string_view(v->str);
}

std::optional<bool> json_value::bool_at(std::string_view key) const noexcept {
    const json_value* v = find(key);
    if (!v || !v->is_bool()) {
        return std::nullopt;
    }
    return v->boolean;
}

json_value& json_value::set(std::string key, json_value v) {
    k = kind::object;
    for (auto& [name, child] : object) {
        if (name == key) {
            *child = std::move(v);
            return *child;
        }
    }
    object.emplace_back(std::move(key), std::make_unique<json_value>(std::move(v)));
    return *object.back().second;
}

json_value& json_value::push(json_value v) {
    k = kind::array;
    array.push_back(std::make_unique<json_value>(std::move(v)));
    return *array.back();
}

result<json_value> parse_json(std::string_view text) {
    json_parser parser(text);
    auto value = parser.parse_value(0);
    if (value) {
        parser.cur.skip_ws();
        if (!parser.cur.eof()) {
            parser.fail("trailing characters after document");
            value.reset();
        }
    }
    if (!value) {
        std::cerr << "[specir][json] " << parser.error << "\n";
        return std::unexpected(make_error_code(error_code::openapi_parse_error));
    }
    return std::move(*value);
}

result<json_value> parse_document(std::string_view text) {
    auto trimmed = trim_view(text);
    if (trimmed.empty()) {
        return std::unexpected(make_error_code(error_code::openapi_parse_error));
    }
    if (trimmed.front() == '{' || trimmed.front() == '[') {
        return parse_json(trimmed);
    }
    std::string yaml_error;
    auto maybe_json = yaml_to_json(trimmed, &yaml_error);
    if (!maybe_json) {
        if (!yaml_error.empty()) {
            std::cerr << "[specir][yaml] " << yaml_error << "\n";
        }
        return std::unexpected(make_error_code(error_code::openapi_parse_error));
    }
    return parse_json(*maybe_json);
}

std::string to_json(const json_value& v) {
    std::ostringstream os;
    write_json(v, os);
    return os.str();
}

} // namespace specir::serde
