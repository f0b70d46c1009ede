#pragma once

#include "json_value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace specir::openapi {

struct normalized_type {
    std::optional<std::string> type;
    bool is_nullable = false;
    std::vector<std::string> warnings;
};

// Normalizes a schema "type" field: absent, a scalar string, or a list of strings
// (OpenAPI 3.1). "null" entries set is_nullable; of several non-null types the first wins.
normalized_type normalize_type(const serde::json_value* type_field,
                               std::optional<std::string_view> schema_name = std::nullopt);

} // namespace specir::openapi
