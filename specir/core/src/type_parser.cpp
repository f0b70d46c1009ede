#include "specir/core/type_parser.hpp"

namespace specir::openapi {

namespace {

std::string schema_display(std::optional<std::string_view> schema_name) {
    if (!schema_name) {
        return "Schema";
    }
    std::string out;
    out.reserve(schema_name->size() + 2);
    out += '\'';
    out += *schema_name;
    out += '\'';
    return out;
}

} // namespace

normalized_type normalize_type(const serde::json_value* type_field,
                               std::optional<std::string_view> schema_name) {
    normalized_type out;
    if (!type_field || type_field->is_null()) {
        return out;
    }

    if (type_field->is_string()) {
        if (type_field->str == "null") {
            out.is_nullable = true;
        } else {
            out.type = type_field->str;
        }
        return out;
    }

    if (type_field->is_array()) {
        std::vector<std::string_view> non_null;
        for (const auto& entry : type_field->array) {
            if (!entry->is_string()) {
                continue;
            }
            if (entry->str == "null") {
                out.is_nullable = true;
            } else {
                non_null.push_back(entry->str);
            }
        }
        if (non_null.empty()) {
            return out;
        }
        out.type = std::string(non_null.front());
        if (non_null.size() > 1) {
            std::string listed;
            for (size_t i = 0; i < non_null.size(); ++i) {
                if (i > 0) {
                    listed += ", ";
                }
                listed += '\'';
                listed += non_null[i];
                listed += '\'';
            }
            out.warnings.push_back(schema_display(schema_name) + " has multiple types: " + listed +
                                   ". Using '" + std::string(non_null.front()) + "'.");
        }
        return out;
    }

    out.warnings.push_back(schema_display(schema_name) +
                           " has unexpected 'type' field: " + serde::to_json(*type_field) +
                           ". Ignoring.");
    return out;
}

} // namespace specir::openapi
