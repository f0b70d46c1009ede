#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace specir::openapi {

class schema_store;

using enum_value = std::variant<std::monostate, bool, int64_t, double, std::string>;

enum class placeholder_kind : uint8_t { none, cycle, unresolved_ref, max_depth };

enum class param_location : uint8_t { path, query, header, cookie };

enum class http_method : uint8_t { get, put, post, del, options, head, patch, trace };

struct discriminator_info {
    std::string property_name;
    // $ref (or bare schema name) -> discriminator value, in declaration order
    std::vector<std::pair<std::string, std::string>> mapping;
};

struct ir_schema;

using name_set = std::set<std::string, std::less<>>;
using property_list = std::vector<std::pair<std::string, ir_schema*>>;
// (schema name, property name) pairs
using schema_property_set = std::set<std::pair<std::string, std::string>>;

struct ir_schema {
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<std::string> format;
    std::optional<std::string> description;

    property_list properties;
    name_set required;
    ir_schema* items = nullptr;
    std::optional<std::vector<enum_value>> enum_values;

    std::optional<std::vector<ir_schema*>> any_of;
    std::optional<std::vector<ir_schema*>> all_of;
    std::optional<std::vector<ir_schema*>> one_of;
    std::optional<discriminator_info> discriminator;

    std::optional<bool> additional_properties_allowed;
    ir_schema* additional_properties = nullptr;

    bool is_nullable = false;
    bool is_data_wrapper = false;

    bool is_circular_ref = false;
    std::string circular_ref_path;
    bool from_unresolved_ref = false;
    placeholder_kind placeholder = placeholder_kind::none;

    // Promoted or extracted property slots point at the schema they stand for.
    const ir_schema* refers_to = nullptr;

    // Naming context for inline nodes (OuterSchema.details -> "OuterSchema", "details").
    std::string parent_context;
    std::string field_context;

    std::optional<std::string> generation_name;
    std::optional<std::string> final_module_stem;

    [[nodiscard]] ir_schema* property(std::string_view key) const noexcept;
    [[nodiscard]] bool has_property(std::string_view key) const noexcept {
        return property(key) != nullptr;
    }
    [[nodiscard]] bool is_required(std::string_view key) const noexcept {
        return required.contains(key);
    }

    // Replaces the schema stored under an existing key; returns false if the key is absent.
    bool replace_property(std::string_view key, ir_schema* replacement) noexcept;

    // generation_name is write-once: a second, different assignment is refused.
    bool assign_generation_name(std::string generation, std::string module_stem);

    [[nodiscard]] bool is_placeholder() const noexcept {
        return placeholder != placeholder_kind::none;
    }
    [[nodiscard]] bool has_composition() const noexcept {
        return (any_of && !any_of->empty()) || (all_of && !all_of->empty()) ||
               (one_of && !one_of->empty());
    }
    [[nodiscard]] std::string_view name_or(std::string_view fallback) const noexcept {
        return name ? std::string_view(*name) : fallback;
    }
};

struct ir_parameter {
    std::string name;
    param_location in = param_location::query;
    bool required = false;
    ir_schema* schema = nullptr;
    std::optional<std::string> description;
};

struct ir_request_body {
    bool required = false;
    std::vector<std::pair<std::string, ir_schema*>> content;
    std::optional<std::string> description;
};

struct ir_response {
    std::string status_code;
    std::optional<std::string> description;
    std::vector<std::pair<std::string, ir_schema*>> content;
    bool stream = false;
    std::optional<std::string> stream_format;
};

struct ir_operation {
    std::string operation_id;
    http_method method = http_method::get;
    std::string path;
    std::optional<std::string> summary;
    std::optional<std::string> description;
    std::vector<ir_parameter> parameters;
    std::optional<ir_request_body> request_body;
    std::vector<ir_response> responses;
    std::vector<std::string> tags;
};

struct unified_discriminator_enum {
    std::string name;
    std::string property_name;
    std::string union_name;
    std::vector<std::pair<std::string, enum_value>> members;
    name_set skipped_variant_enums;
    std::string description;
};

struct ir_spec {
    ir_spec();
    ~ir_spec();
    ir_spec(ir_spec&&) noexcept;
    ir_spec& operator=(ir_spec&&) noexcept;
    ir_spec(const ir_spec&) = delete;
    ir_spec& operator=(const ir_spec&) = delete;

    std::string title = "API Client";
    std::string version = "0.0.0";
    std::optional<std::string> description;
    std::unique_ptr<schema_store> schemas;
    std::vector<ir_operation> operations;
    std::vector<std::string> servers;
    name_set discriminator_skip_list;
    std::vector<unified_discriminator_enum> unified_enums;
    std::vector<std::string> warnings;

    [[nodiscard]] const ir_schema* schema(std::string_view name) const noexcept;
};

std::string_view http_method_name(http_method m) noexcept;
std::optional<http_method> http_method_from_string(std::string_view sv) noexcept;
std::string_view param_location_name(param_location loc) noexcept;
std::optional<param_location> param_location_from_string(std::string_view sv) noexcept;

std::string enum_value_to_string(const enum_value& v);

} // namespace specir::openapi
