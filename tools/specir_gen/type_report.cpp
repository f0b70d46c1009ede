#include "generator.hpp"

#include "specir/core/module_graph.hpp"
#include "specir/core/schema_store.hpp"
#include "specir/core/type_resolver.hpp"

#include <sstream>

namespace specir_gen {

using specir::openapi::import_collector;
using specir::openapi::module_graph;
using specir::openapi::resolved_type;
using specir::openapi::type_resolver;

namespace {

std::string annotation(const resolved_type& r) {
    std::string out = r.is_forward_ref ? "\"" + r.type + "\"" : r.type;
    if (r.is_optional) {
        out = "Optional[" + out + "]";
    }
    return out;
}

} // namespace

std::string type_report(const ir_spec& spec, std::vector<std::string>& warnings) {
    const auto& store = *spec.schemas;
    module_graph graph = module_graph::build(store, spec.discriminator_skip_list);
    type_resolver resolver(store);

    std::ostringstream os;
    for (const auto& [name, s] : store) {
        if (spec.discriminator_skip_list.contains(name) || !s->final_module_stem) {
            continue;
        }
        import_collector imports(graph, *s->final_module_stem);
        os << "[types] " << s->generation_name.value_or(name) << " (" << *s->final_module_stem
           << ")\n";

        if (s->enum_values) {
            os << "  enum: " << s->enum_values->size() << " values\n";
        } else if (!s->properties.empty()) {
            for (const auto& [key, prop] : s->properties) {
                resolved_type r = resolver.resolve_schema(prop, imports, s->is_required(key));
                if (r.is_optional) {
                    imports.add_typing_import("Optional");
                }
                os << "  " << key << ": " << annotation(r) << "\n";
            }
        } else {
            resolved_type r = resolver.resolve_schema(s, imports, true, true);
            os << "  = " << annotation(r) << "\n";
        }

        for (const auto& line : imports.statements()) {
            os << "  " << line << "\n";
        }
    }

    for (auto& w : resolver.take_warnings()) {
        warnings.push_back(std::move(w));
    }
    return os.str();
}

} // namespace specir_gen
