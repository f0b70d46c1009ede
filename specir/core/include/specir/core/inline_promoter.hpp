#pragma once

#include "ir.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace specir::openapi {

class parsing_context;
class schema_store;

// Name a promoted inline object would get, in priority order: singularized key with an
// entity suffix, then Parent+Key, then Parent+Key with a counter starting at 1.
std::string choose_promoted_name(const parsing_context& ctx,
                                 std::optional<std::string_view> parent_name,
                                 std::string_view property_key,
                                 const ir_schema& property);

// Hoists an anonymous inline object property into the store. Returns the lightweight
// slot that should replace the property, or nullptr when the property is not promotable.
ir_schema* promote_inline_object(parsing_context& ctx,
                                 std::optional<std::string_view> parent_name,
                                 std::string_view property_key,
                                 ir_schema* property);

// Names anonymous complex array items {Schema}{Prop}Item (or {Schema}Item for array
// schemas) and registers them. Returns the number of schemas registered.
size_t extract_inline_array_items(schema_store& store);

// Hoists anonymous enum-valued properties to {Schema}{Prop}Enum, except the pairs in
// skip. Returns the number of enum schemas registered.
size_t extract_inline_enums(schema_store& store, const schema_property_set& skip = {});

// First name among base, base1, base2, ... that is unused or already maps to instance.
std::string unique_schema_name(const schema_store& store,
                               const std::string& base,
                               const ir_schema* instance = nullptr);

} // namespace specir::openapi
