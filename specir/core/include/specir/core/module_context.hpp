#pragma once

#include <string>
#include <string_view>

namespace specir::openapi {

struct module_resolution {
    std::string path;            // import path relative to the current module, "" for itself
    bool is_forward_ref = false; // reference the type by name instead of importing it
};

// What the type resolver needs from the module being generated.
class module_context {
public:
    virtual ~module_context() = default;

    virtual void add_import(std::string_view module, std::string_view name) = 0;
    virtual void add_typing_import(std::string_view name) = 0;
    virtual module_resolution resolve_relative_or_forward(std::string_view target_module) = 0;
    [[nodiscard]] virtual std::string_view current_module() const noexcept = 0;
};

} // namespace specir::openapi
