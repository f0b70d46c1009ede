#pragma once

#include "result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace specir::serde {

// Decoded document tree. Object members keep their source order.
struct json_value {
    enum class kind : uint8_t { null, boolean, number, string, object, array };

    kind k{kind::null};
    bool boolean = false;
    double number = 0.0;
    std::optional<int64_t> integer; // set for literals without fraction or exponent
    std::string str;
    std::vector<std::pair<std::string, std::unique_ptr<json_value>>> object;
    std::vector<std::unique_ptr<json_value>> array;

    static json_value null_value() { return json_value{}; }

    static json_value boolean_value(bool v) {
        json_value n;
        n.k = kind::boolean;
        n.boolean = v;
        return n;
    }

    static json_value number_value(double v, std::optional<int64_t> as_integer = std::nullopt) {
        json_value n;
        n.k = kind::number;
        n.number = v;
        n.integer = as_integer;
        return n;
    }

    static json_value string_value(std::string v) {
        json_value n;
        n.k = kind::string;
        n.str = std::move(v);
        return n;
    }

    static json_value object_value() {
        json_value n;
        n.k = kind::object;
        return n;
    }

    static json_value array_value() {
        json_value n;
        n.k = kind::array;
        return n;
    }

    [[nodiscard]] bool is_null() const noexcept { return k == kind::null; }
    [[nodiscard]] bool is_bool() const noexcept { return k == kind::boolean; }
    [[nodiscard]] bool is_number() const noexcept { return k == kind::number; }
    [[nodiscard]] bool is_string() const noexcept { return k == kind::string; }
    [[nodiscard]] bool is_object() const noexcept { return k == kind::object; }
    [[nodiscard]] bool is_array() const noexcept { return k == kind::array; }

    [[nodiscard]] const json_value* find(std::string_view key) const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return find(key) != nullptr;
    }
    [[nodiscard]] std::optional<std::string_view> string_at(std::string_view key) const noexcept;
    [[nodiscard]] std::optional<bool> bool_at(std::string_view key) const noexcept;

    json_value& set(std::string key, json_value v);
    json_value& push(json_value v);
};

result<json_value> parse_json(std::string_view text);

// Accepts JSON, or the YAML subset understood by yaml_to_json.
result<json_value> parse_document(std::string_view text);

std::string to_json(const json_value& v);

} // namespace specir::serde
