#pragma once

#include "ir.hpp"
#include "module_context.hpp"

#include <set>
#include <string>
#include <vector>

namespace specir::openapi {

class schema_store;

struct resolved_type {
    std::string type;
    bool needs_import = false;
    std::string import_module;
    std::string import_name;
    bool is_optional = false;
    bool is_forward_ref = false;
};

// Maps finished IR schemas to Python type annotations ("List[Pet]", "Union[int, str]"),
// recording the imports each one needs in the given module_context.
class type_resolver {
public:
    explicit type_resolver(const schema_store& store) noexcept : store_(store) {}

    // resolve_underlying unwraps a named primitive alias to its underlying type.
    resolved_type resolve_schema(const ir_schema* schema,
                                 module_context& ctx,
                                 bool required = true,
                                 bool resolve_underlying = false);

    [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }
    std::vector<std::string> take_warnings() noexcept { return std::move(warnings_); }

private:
    resolved_type dispatch(const ir_schema& schema,
                           module_context& ctx,
                           bool required,
                           bool resolve_underlying);
    resolved_type resolve_named(const ir_schema& schema, module_context& ctx);
    resolved_type resolve_union(const std::vector<ir_schema*>& members,
                                module_context& ctx,
                                bool resolve_underlying);
    resolved_type resolve_all_of(const std::vector<ir_schema*>& members,
                                 module_context& ctx,
                                 bool required,
                                 bool resolve_underlying);
    resolved_type resolve_string(const ir_schema& schema, module_context& ctx);
    resolved_type resolve_array(const ir_schema& schema,
                                module_context& ctx,
                                bool resolve_underlying);
    resolved_type resolve_any(module_context& ctx);

    // Element annotation inside List[...] or Union[...]: forward refs are quoted.
    std::string element_type(const ir_schema* element,
                             module_context& ctx,
                             bool resolve_underlying,
                             resolved_type* out = nullptr);

    const schema_store& store_;
    std::set<const ir_schema*> in_progress_;
    std::vector<std::string> warnings_;
};

} // namespace specir::openapi
