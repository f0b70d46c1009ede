#include "specir/core/type_resolver.hpp"

#include "specir/core/schema_store.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace specir::openapi {

namespace {

struct format_mapping {
    std::string_view format;
    std::string_view type;
    std::string_view module; // empty when no import is needed
};

constexpr std::array<format_mapping, 9> kStringFormats = {{
    {"date", "date", "datetime"},
    {"date-time", "datetime", "datetime"},
    {"time", "time", "datetime"},
    {"uuid", "UUID", "uuid"},
    {"email", "str", ""},
    {"uri", "str", ""},
    {"hostname", "str", ""},
    {"ipv4", "str", ""},
    {"ipv6", "str", ""},
}};

bool is_primitive_alias(const ir_schema* s) noexcept {
    if (!s || !s->name || !s->properties.empty() || !s->type) {
        return false;
    }
    const std::string& t = *s->type;
    return t == "string" || t == "integer" || t == "number" || t == "boolean";
}

resolved_type plain(std::string type) {
    resolved_type r;
    r.type = std::move(type);
    return r;
}

} // namespace

resolved_type type_resolver::resolve_schema(const ir_schema* schema,
                                            module_context& ctx,
                                            bool required,
                                            bool resolve_underlying) {
    if (!schema) {
        return resolve_any(ctx);
    }
    if (!in_progress_.insert(schema).second) {
        return resolve_any(ctx);
    }
    resolved_type out = dispatch(*schema, ctx, required, resolve_underlying);
    in_progress_.erase(schema);

    out.is_optional = !required || schema->is_nullable;
    out.needs_import = !out.import_module.empty() && !out.import_name.empty();
    return out;
}

resolved_type type_resolver::dispatch(const ir_schema& schema,
                                      module_context& ctx,
                                      bool required,
                                      bool resolve_underlying) {
    if (schema.refers_to) {
        return resolve_schema(schema.refers_to, ctx, required, resolve_underlying);
    }

    if (schema.name && schema.generation_name && !resolve_underlying) {
        return resolve_named(schema, ctx);
    }

    if (schema.any_of && !schema.any_of->empty()) {
        return resolve_union(*schema.any_of, ctx, resolve_underlying);
    }
    if (schema.all_of && !schema.all_of->empty()) {
        return resolve_all_of(*schema.all_of, ctx, required, resolve_underlying);
    }
    if (schema.one_of && !schema.one_of->empty()) {
        return resolve_union(*schema.one_of, ctx, resolve_underlying);
    }

    if (schema.name) {
        const ir_schema* registered = store_.find(*schema.name);
        if (registered && registered != &schema) {
            return resolve_schema(registered, ctx, required, resolve_underlying);
        }
    }

    if (!schema.type) {
        return resolve_any(ctx);
    }
    const std::string& type = *schema.type;
    if (const ir_schema* named = store_.find(type); named && named != &schema && named->name) {
        return resolve_schema(named, ctx, required, resolve_underlying);
    }

    if (type == "string") {
        return resolve_string(schema, ctx);
    }
    if (type == "integer") {
        return plain("int");
    }
    if (type == "number") {
        return plain("float");
    }
    if (type == "boolean") {
        return plain("bool");
    }
    if (type == "null") {
        return plain("None");
    }
    if (type == "array") {
        return resolve_array(schema, ctx, resolve_underlying);
    }
    if (type == "object") {
        ctx.add_typing_import("Dict");
        ctx.add_typing_import("Any");
        return plain("Dict[str, Any]");
    }

    warnings_.push_back("Unknown schema type: " + type);
    return resolve_any(ctx);
}

resolved_type type_resolver::resolve_named(const ir_schema& schema, module_context& ctx) {
    const std::string& class_name = *schema.generation_name;
    if (!schema.final_module_stem) {
        warnings_.push_back("Named schema " + *schema.name + " missing final_module_stem");
        return plain(class_name);
    }

    module_resolution where = ctx.resolve_relative_or_forward(*schema.final_module_stem);
    resolved_type out = plain(class_name);
    if (where.is_forward_ref) {
        out.is_forward_ref = true;
        return out;
    }
    ctx.add_import(where.path, class_name);
    out.import_module = std::move(where.path);
    out.import_name = class_name;
    return out;
}

std::string type_resolver::element_type(const ir_schema* element,
                                        module_context& ctx,
                                        bool resolve_underlying,
                                        resolved_type* out) {
    const bool unwrap = resolve_underlying && is_primitive_alias(element);
    resolved_type r = resolve_schema(element, ctx, true, unwrap);
    std::string text = r.type;
    if (r.is_forward_ref && !text.starts_with('"')) {
        text = "\"" + text + "\"";
    }
    if (out) {
        *out = std::move(r);
    }
    return text;
}

resolved_type type_resolver::resolve_union(const std::vector<ir_schema*>& members,
                                           module_context& ctx,
                                           bool resolve_underlying) {
    std::vector<std::string> types;
    types.reserve(members.size());
    resolved_type single;
    for (const ir_schema* member : members) {
        types.push_back(element_type(member, ctx, resolve_underlying, &single));
    }
    std::sort(types.begin(), types.end());
    types.erase(std::unique(types.begin(), types.end()), types.end());

    if (members.size() == 1) {
        return single;
    }
    if (types.size() == 1) {
        return plain(types.front());
    }

    ctx.add_typing_import("Union");
    std::string joined = "Union[";
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += types[i];
    }
    joined += ']';
    return plain(std::move(joined));
}

resolved_type type_resolver::resolve_all_of(const std::vector<ir_schema*>& members,
                                            module_context& ctx,
                                            bool required,
                                            bool resolve_underlying) {
    for (const ir_schema* member : members) {
        if (member && member->type) {
            return resolve_schema(member, ctx, required, resolve_underlying);
        }
    }
    return resolve_schema(members.front(), ctx, required, resolve_underlying);
}

resolved_type type_resolver::resolve_string(const ir_schema& schema, module_context& ctx) {
    if (schema.enum_values) {
        if (!schema.name) {
            std::string where;
            if (!schema.field_context.empty()) {
                where = " '" + schema.parent_context + "." + schema.field_context + "'";
            }
            warnings_.push_back("Found inline enum in string schema" + where +
                                "; it should have been promoted");
        }
        return plain("str");
    }
    if (!schema.format) {
        return plain("str");
    }
    for (const auto& mapping : kStringFormats) {
        if (mapping.format != *schema.format) {
            continue;
        }
        if (!mapping.module.empty()) {
            ctx.add_import(mapping.module, mapping.type);
        }
        return plain(std::string(mapping.type));
    }
    // unrecognized formats are plain strings
    return plain("str");
}

resolved_type type_resolver::resolve_array(const ir_schema& schema,
                                           module_context& ctx,
                                           bool resolve_underlying) {
    ctx.add_typing_import("List");
    if (!schema.items) {
        ctx.add_typing_import("Any");
        return plain("List[Any]");
    }
    return plain("List[" + element_type(schema.items, ctx, resolve_underlying) + "]");
}

resolved_type type_resolver::resolve_any(module_context& ctx) {
    ctx.add_typing_import("Any");
    return plain("Any");
}

} // namespace specir::openapi
