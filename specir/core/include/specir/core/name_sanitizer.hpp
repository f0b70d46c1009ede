#pragma once

#include <string>
#include <string_view>

namespace specir::openapi {

class schema_store;

// PascalCase class name: "user_profile-v2" -> "UserProfileV2".
std::string sanitize_class_name(std::string_view raw);
// snake_case module stem that splits CamelCase: "HTTPResponseCode" -> "http_response_code".
std::string sanitize_module_name(std::string_view raw);
// snake_case method name used for operations without an operationId.
std::string sanitize_method_name(std::string_view raw);

std::string sanitize_identifier(std::string_view name);
std::string to_snake_case(std::string_view id);
std::string capitalize_first(std::string_view word);
bool is_reserved_word(std::string_view word) noexcept;

// Assigns generation_name/final_module_stem to every registered schema that lacks them.
// Both are unique across the store.
void finalize_generation_names(schema_store& store);

} // namespace specir::openapi
