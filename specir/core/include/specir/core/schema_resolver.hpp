#pragma once

#include "ir.hpp"
#include "json_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace specir::openapi {

class parsing_context;

// Closed set of node shapes; decided once per node, before any child is visited.
enum class schema_shape : uint8_t { ref, all_of, any_of, one_of, object, array, enum_, scalar };

schema_shape classify_shape(const serde::json_value& node) noexcept;
std::string_view schema_shape_name(schema_shape shape) noexcept;

constexpr std::string_view kComponentSchemaPrefix = "#/components/schemas/";

// Recursive-descent resolver from raw schema nodes to ir_schema. Named entries own a
// canonical slot in the store that is reserved before their children are visited, so
// every reference to the name (including cyclic ones) yields the same instance.
class schema_resolver {
public:
    explicit schema_resolver(parsing_context& ctx) noexcept : ctx_(ctx) {}

    // Resolves node under a global name. The result is registered under that name.
    ir_schema* resolve(std::string_view name, const serde::json_value* node);

    // Resolves components/schemas/<name>.
    ir_schema* resolve_component(std::string_view name);

    // Resolves an anonymous node. parent_context/field_context are recorded on the
    // result and drive the names of anything promoted beneath it.
    ir_schema* resolve_inline(const serde::json_value* node,
                              std::string_view parent_context = {},
                              std::string_view field_context = {});

    // Resolves a "$ref" value. Unresolvable targets yield a placeholder and a warning.
    ir_schema* resolve_ref(std::string_view ref);

private:
    struct frame {
        std::optional<std::string_view> name; // global name for named entries
        std::string context_name;             // naming prefix for children
        std::string_view parent_context;
        std::string_view field_context;
    };

    ir_schema* resolve_node(const frame& f, const serde::json_value* node);
    void build_alias(ir_schema& out, const serde::json_value& node);
    void build(ir_schema& out, const frame& f, const serde::json_value& node, schema_shape shape);

    std::optional<std::vector<ir_schema*>> resolve_members(const serde::json_value& list,
                                                           const frame& f,
                                                           bool& saw_null);
    property_list resolve_properties(const serde::json_value& props,
                                     const frame& f,
                                     std::optional<std::string_view> parent_name);
    ir_schema* resolve_items(const serde::json_value& items, const frame& f);

    ir_schema* cycle_placeholder(std::string_view name, const std::string& path);
    ir_schema* depth_placeholder(std::optional<std::string_view> name, size_t limit);
    ir_schema* unresolved_placeholder(std::string_view name);
    ir_schema* fallback_ref(std::string_view ref, std::string_view ref_name);

    parsing_context& ctx_;
};

} // namespace specir::openapi
