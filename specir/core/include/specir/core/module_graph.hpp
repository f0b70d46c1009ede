#pragma once

#include "ir.hpp"
#include "module_context.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace specir::openapi {

class schema_store;

// Directed "module A mentions a type defined in module B" edges between the module stems
// of registered schemas. Anonymous nodes are walked through; named ones end a walk.
class module_graph {
public:
    using edge_map = std::map<std::string, std::set<std::string, std::less<>>, std::less<>>;

    static module_graph build(const schema_store& store, const name_set& skip = {});

    [[nodiscard]] bool reaches(std::string_view from, std::string_view to) const;
    [[nodiscard]] bool in_cycle(std::string_view a, std::string_view b) const {
        return reaches(a, b) && reaches(b, a);
    }
    [[nodiscard]] const edge_map& edges() const noexcept { return edges_; }
    [[nodiscard]] size_t module_count() const noexcept { return edges_.size(); }

private:
    edge_map edges_;
};

// module_context for one generated module. Targets that can reach the current module
// again are forward-referenced rather than imported, which keeps the import graph acyclic.
class import_collector final : public module_context {
public:
    import_collector(const module_graph& graph, std::string current_module)
        : graph_(graph), current_(std::move(current_module)) {}

    void add_import(std::string_view module, std::string_view name) override;
    void add_typing_import(std::string_view name) override { add_import("typing", name); }
    module_resolution resolve_relative_or_forward(std::string_view target_module) override;
    [[nodiscard]] std::string_view current_module() const noexcept override { return current_; }

    [[nodiscard]] bool has_import(std::string_view module, std::string_view name) const;
    [[nodiscard]] const std::map<std::string, std::set<std::string, std::less<>>, std::less<>>&
    imports() const noexcept {
        return imports_;
    }
    // "from <module> import a, b" lines, ordered by module then name.
    [[nodiscard]] std::vector<std::string> statements() const;
    void clear() noexcept { imports_.clear(); }

private:
    const module_graph& graph_;
    std::string current_;
    std::map<std::string, std::set<std::string, std::less<>>, std::less<>> imports_;
};

} // namespace specir::openapi
