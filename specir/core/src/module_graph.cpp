#include "specir/core/module_graph.hpp"

#include "specir/core/schema_store.hpp"

#include <deque>
#include <unordered_set>

namespace specir::openapi {

namespace {

void push_children(const ir_schema& s, std::vector<const ir_schema*>& out) {
    for (const auto& [key, prop] : s.properties) {
        out.push_back(prop);
    }
    out.push_back(s.items);
    out.push_back(s.additional_properties);
    out.push_back(s.refers_to);
    for (const auto* list : {&s.any_of, &s.all_of, &s.one_of}) {
        if (*list) {
            out.insert(out.end(), (*list)->begin(), (*list)->end());
        }
    }
}

} // namespace

module_graph module_graph::build(const schema_store& store, const name_set& skip) {
    module_graph graph;
    for (const auto& [name, s] : store) {
        if (!s || !s->final_module_stem || skip.contains(name)) {
            continue;
        }
        const std::string& from = *s->final_module_stem;
        auto& targets = graph.edges_[from];

        std::unordered_set<const ir_schema*> seen{s};
        std::vector<const ir_schema*> stack;
        push_children(*s, stack);
        while (!stack.empty()) {
            const ir_schema* node = stack.back();
            stack.pop_back();
            if (!node || !seen.insert(node).second) {
                continue;
            }
            if (node->final_module_stem) {
                if (*node->final_module_stem != from) {
                    targets.insert(*node->final_module_stem);
                }
                continue;
            }
            push_children(*node, stack);
        }
    }
    return graph;
}

bool module_graph::reaches(std::string_view from, std::string_view to) const {
    if (from == to) {
        return true;
    }
    std::set<std::string_view> visited{from};
    std::deque<std::string_view> queue{from};
    while (!queue.empty()) {
        std::string_view current = queue.front();
        queue.pop_front();
        auto it = edges_.find(current);
        if (it == edges_.end()) {
            continue;
        }
        for (const auto& next : it->second) {
            if (next == to) {
                return true;
            }
            if (visited.insert(next).second) {
                queue.push_back(next);
            }
        }
    }
    return false;
}

void import_collector::add_import(std::string_view module, std::string_view name) {
    if (module.empty() || name.empty()) {
        return;
    }
    auto it = imports_.find(module);
    if (it == imports_.end()) {
        it = imports_.emplace(std::string(module), std::set<std::string, std::less<>>{}).first;
    }
    it->second.emplace(name);
}

module_resolution import_collector::resolve_relative_or_forward(std::string_view target_module) {
    if (target_module == current_) {
        return {"", true};
    }
    std::string path = "." + std::string(target_module);
    return {std::move(path), graph_.reaches(target_module, current_)};
}

bool import_collector::has_import(std::string_view module, std::string_view name) const {
    auto it = imports_.find(module);
    return it != imports_.end() && it->second.contains(name);
}

std::vector<std::string> import_collector::statements() const {
    std::vector<std::string> out;
    out.reserve(imports_.size());
    for (const auto& [module, names] : imports_) {
        std::string line = "from " + module + " import ";
        bool first = true;
        for (const auto& name : names) {
            if (!first) {
                line += ", ";
            }
            line += name;
            first = false;
        }
        out.push_back(std::move(line));
    }
    return out;
}

} // namespace specir::openapi
