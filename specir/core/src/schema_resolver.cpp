#include "specir/core/schema_resolver.hpp"

#include "specir/core/allof_merger.hpp"
#include "specir/core/inline_promoter.hpp"
#include "specir/core/name_sanitizer.hpp"
#include "specir/core/parsing_context.hpp"
#include "specir/core/type_parser.hpp"

#include <array>
#include <iostream>

namespace specir::openapi {

namespace {

using serde::json_value;

constexpr std::string_view kListResponseSuffix = "ListResponse";
constexpr std::array<std::string_view, 7> kStrippableSuffixes = {
    "Response", "Create", "Update", "Request", "Input", "Output", "Data"};

std::string_view declared_type(const json_value& node) noexcept {
    const json_value* t = node.find("type");
    if (!t) {
        return {};
    }
    if (t->is_string()) {
        return t->str;
    }
    if (t->is_array()) {
        for (const auto& entry : t->array) {
            if (entry->is_string() && entry->str != "null") {
                return entry->str;
            }
        }
    }
    return {};
}

bool is_null_member(const json_value& member) noexcept {
    if (!member.is_object()) {
        return false;
    }
    auto type = member.string_at("type");
    return type && *type == "null";
}

std::string child_context(std::string_view parent, std::string_view field) {
    if (field.empty()) {
        return std::string(parent);
    }
    std::string raw(parent);
    raw += '_';
    raw += field;
    return sanitize_class_name(raw);
}

std::optional<enum_value> to_enum_value(const json_value& v) {
    switch (v.k) {
    case json_value::kind::null:
        return enum_value{std::monostate{}};
    case json_value::kind::boolean:
        return enum_value{v.boolean};
    case json_value::kind::number:
        if (v.integer) {
            return enum_value{*v.integer};
        }
        return enum_value{v.number};
    case json_value::kind::string:
        return enum_value{v.str};
    case json_value::kind::object:
    case json_value::kind::array:
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<discriminator_info> read_discriminator(const json_value& node) {
    const json_value* d = node.find("discriminator");
    if (!d || !d->is_object()) {
        return std::nullopt;
    }
    auto property = d->string_at("propertyName");
    if (!property || property->empty()) {
        return std::nullopt;
    }
    discriminator_info info;
    info.property_name = std::string(*property);
    if (const json_value* mapping = d->find("mapping"); mapping && mapping->is_object()) {
        for (const auto& [value, target] : mapping->object) {
            if (target && target->is_string()) {
                info.mapping.emplace_back(target->str, value);
            }
        }
    }
    return info;
}

name_set read_required(const json_value& node) {
    name_set out;
    if (const json_value* req = node.find("required"); req && req->is_array()) {
        for (const auto& entry : req->array) {
            if (entry->is_string()) {
                out.insert(entry->str);
            }
        }
    }
    return out;
}

std::string_view last_segment(std::string_view ref) noexcept {
    auto pos = ref.rfind('/');
    return pos == std::string_view::npos ? ref : ref.substr(pos + 1);
}

} // namespace

schema_shape classify_shape(const json_value& node) noexcept {
    if (node.contains("$ref")) {
        return schema_shape::ref;
    }
    if (node.contains("allOf")) {
        return schema_shape::all_of;
    }
    if (node.contains("anyOf")) {
        return schema_shape::any_of;
    }
    if (node.contains("oneOf")) {
        return schema_shape::one_of;
    }
    if (const json_value* e = node.find("enum"); e && e->is_array()) {
        return schema_shape::enum_;
    }
    std::string_view type = declared_type(node);
    if (type == "array" || (type.empty() && node.contains("items"))) {
        return schema_shape::array;
    }
    if (type == "object" ||
        (type.empty() && (node.contains("properties") || node.contains("additionalProperties")))) {
        return schema_shape::object;
    }
    return schema_shape::scalar;
}

std::string_view schema_shape_name(schema_shape shape) noexcept {
    switch (shape) {
    case schema_shape::ref:
        return "ref";
    case schema_shape::all_of:
        return "allOf";
    case schema_shape::any_of:
        return "anyOf";
    case schema_shape::one_of:
        return "oneOf";
    case schema_shape::object:
        return "object";
    case schema_shape::array:
        return "array";
    case schema_shape::enum_:
        return "enum";
    case schema_shape::scalar:
        return "scalar";
    }
    return "unknown";
}

ir_schema* schema_resolver::resolve(std::string_view name, const json_value* node) {
    if (ir_schema* cached = ctx_.store().find(name); cached && !ctx_.is_parsing(name)) {
        return cached;
    }
    return resolve_node(frame{name, std::string(name), {}, {}}, node);
}

ir_schema* schema_resolver::resolve_component(std::string_view name) {
    if (const json_value* raw = ctx_.raw_schema(name)) {
        return resolve(name, raw);
    }
    std::string ref(kComponentSchemaPrefix);
    ref += name;
    return resolve_ref(ref);
}

ir_schema* schema_resolver::resolve_inline(const json_value* node,
                                           std::string_view parent_context,
                                           std::string_view field_context) {
    return resolve_node(frame{std::nullopt,
                              child_context(parent_context, field_context),
                              parent_context,
                              field_context},
                        node);
}

ir_schema* schema_resolver::resolve_node(const frame& f, const json_value* node) {
    schema_scope scope(ctx_, f.name);
    const guard_verdict& verdict = scope.verdict();

    if (const auto* hit = std::get_if<cycle_hit>(&verdict)) {
        return cycle_placeholder(*f.name, hit->path);
    }
    if (const auto* deep = std::get_if<depth_exceeded>(&verdict)) {
        return depth_placeholder(f.name, deep->limit);
    }

    if (!node || !node->is_object()) {
        return f.name ? ctx_.store().insert_or_get(*f.name) : ctx_.store().make();
    }

    const schema_shape shape = classify_shape(*node);
    if (shape == schema_shape::ref && !f.name) {
        auto ref = node->string_at("$ref");
        return resolve_ref(ref ? *ref : std::string_view{});
    }

    ir_schema* out = f.name ? ctx_.store().insert_or_get(*f.name) : ctx_.store().make();
    switch (shape) {
    case schema_shape::ref:
        build_alias(*out, *node);
        break;
    case schema_shape::all_of:
    case schema_shape::any_of:
    case schema_shape::one_of:
    case schema_shape::object:
    case schema_shape::array:
    case schema_shape::enum_:
    case schema_shape::scalar:
        build(*out, f, *node, shape);
        break;
    }
    return out;
}

// A named entry whose node is only a $ref becomes a lightweight alias of the target.
void schema_resolver::build_alias(ir_schema& out, const json_value& node) {
    auto ref = node.string_at("$ref");
    ir_schema* target = resolve_ref(ref ? *ref : std::string_view{});

    if (auto d = node.string_at("description")) {
        out.description = std::string(*d);
    } else if (!out.is_circular_ref) {
        out.description.reset();
    }
    out.is_nullable = node.bool_at("nullable").value_or(false) || target->is_nullable;
    if (target == &out) {
        out.type = "object";
        return;
    }
    out.type = target->name;
    out.refers_to = target;
    out.from_unresolved_ref = target->from_unresolved_ref;
    out.placeholder = placeholder_kind::none;
}

void schema_resolver::build(ir_schema& out,
                            const frame& f,
                            const json_value& node,
                            schema_shape shape) {
    std::optional<std::string_view> display = f.name;
    if (!display && !f.context_name.empty()) {
        display = f.context_name;
    }

    bool saw_null = false;
    if (const json_value* any = node.find("anyOf")) {
        out.any_of = resolve_members(*any, f, saw_null);
    }
    if (const json_value* one = node.find("oneOf")) {
        out.one_of = resolve_members(*one, f, saw_null);
    }

    std::optional<std::string> type;
    bool nullable = saw_null;
    if (!out.any_of && !out.one_of) {
        normalized_type nt = normalize_type(node.find("type"), display);
        type = std::move(nt.type);
        nullable = nullable || nt.is_nullable;
        for (auto& w : nt.warnings) {
            ctx_.warn(std::move(w));
        }
    }
    if (node.bool_at("nullable").value_or(false)) {
        nullable = true;
    }

    const json_value* raw_props = node.find("properties");
    name_set required;
    if (shape == schema_shape::all_of) {
        std::vector<ir_schema*> members;
        bool ignored_null = false;
        if (auto parsed = resolve_members(*node.find("allOf"), f, ignored_null)) {
            members = std::move(*parsed);
        }
        property_list siblings;
        if (raw_props) {
            siblings = resolve_properties(*raw_props, f, display);
        }
        all_of_merge merged = merge_all_of(std::move(members), siblings, read_required(node));
        out.properties = std::move(merged.properties);
        required = std::move(merged.required);
        out.all_of = std::move(merged.members);
        if (!type && !out.properties.empty()) {
            type = "object";
        }
    } else {
        if (raw_props) {
            out.properties = resolve_properties(*raw_props, f, display);
        }
        required = read_required(node);
    }

    if (!type && shape == schema_shape::array) {
        type = "array";
    }
    if (!type && (shape == schema_shape::object || !out.properties.empty())) {
        type = "object";
    }

    out.items = nullptr;
    if (type == "array") {
        if (const json_value* items = node.find("items")) {
            out.items = resolve_items(*items, f);
        }
    }

    out.enum_values.reset();
    if (const json_value* e = node.find("enum"); e && e->is_array()) {
        std::vector<enum_value> values;
        values.reserve(e->array.size());
        for (const auto& entry : e->array) {
            if (auto v = to_enum_value(*entry)) {
                values.push_back(std::move(*v));
            }
        }
        out.enum_values = std::move(values);
    }

    out.required.clear();
    for (const auto& key : required) {
        if (out.has_property(key)) {
            out.required.insert(key);
        } else {
            ctx_.warn("Schema '" + std::string(display.value_or("<anonymous_schema>")) +
                      "' lists undefined property '" + key + "' as required; dropping it.");
        }
    }

    if (const json_value* ap = node.find("additionalProperties")) {
        if (ap->is_bool()) {
            out.additional_properties_allowed = ap->boolean;
        } else if (ap->is_object()) {
            out.additional_properties_allowed = true;
            out.additional_properties = resolve_inline(ap, f.context_name, "Value");
        }
    }

    out.discriminator = read_discriminator(node);

    out.type = std::move(type);
    if (auto fmt = node.string_at("format")) {
        out.format = std::string(*fmt);
    } else {
        out.format.reset();
    }
    if (auto d = node.string_at("description")) {
        out.description = std::string(*d);
    } else {
        out.description.reset();
    }
    out.is_nullable = nullable;
    out.is_data_wrapper = out.type == "object" && out.properties.size() == 1 &&
                          out.has_property("data") && out.is_required("data");
    if (!f.name) {
        out.parent_context = std::string(f.parent_context);
        out.field_context = std::string(f.field_context);
    }
    // a cycle may have stood in for this slot while its children were visited
    out.placeholder = placeholder_kind::none;
}

std::optional<std::vector<ir_schema*>>
schema_resolver::resolve_members(const json_value& list, const frame& f, bool& saw_null) {
    if (!list.is_array()) {
        return std::nullopt;
    }
    std::vector<ir_schema*> members;
    members.reserve(list.array.size());
    for (const auto& member : list.array) {
        if (is_null_member(*member)) {
            saw_null = true;
            continue;
        }
        members.push_back(resolve_inline(member.get(), f.context_name));
    }
    if (members.empty()) {
        return std::nullopt;
    }
    return members;
}

property_list schema_resolver::resolve_properties(const json_value& props,
                                                  const frame& f,
                                                  std::optional<std::string_view> parent_name) {
    property_list out;
    if (!props.is_object()) {
        return out;
    }
    out.reserve(props.object.size());
    for (const auto& [key, raw] : props.object) {
        ir_schema* prop = resolve_inline(raw.get(), f.context_name, key);
        if (ir_schema* slot = promote_inline_object(ctx_, parent_name, key, prop)) {
            prop = slot;
        }
        out.emplace_back(key, prop);
    }
    return out;
}

// Component refs keep the target's own name; inline items are parsed under {Name}Item.
ir_schema* schema_resolver::resolve_items(const json_value& items, const frame& f) {
    return resolve_inline(&items, f.context_name, "Item");
}

ir_schema* schema_resolver::resolve_ref(std::string_view ref) {
    if (!ref.starts_with(kComponentSchemaPrefix) || ref.size() == kComponentSchemaPrefix.size()) {
        ctx_.warn("Unsupported or invalid $ref format: " + std::string(ref));
        return unresolved_placeholder(last_segment(ref));
    }
    std::string_view ref_name = ref.substr(kComponentSchemaPrefix.size());

    if (const json_value* raw = ctx_.raw_schema(ref_name)) {
        return resolve(ref_name, raw);
    }
    if (ir_schema* known = ctx_.store().find(ref_name)) {
        return known;
    }
    return fallback_ref(ref, ref_name);
}

ir_schema* schema_resolver::fallback_ref(std::string_view ref, std::string_view ref_name) {
    if (ref_name.size() > kListResponseSuffix.size() && ref_name.ends_with(kListResponseSuffix)) {
        std::string_view base = ref_name.substr(0, ref_name.size() - kListResponseSuffix.size());
        if (const json_value* raw = ctx_.raw_schema(base)) {
            ctx_.warn("Resolved $ref: " + std::string(ref) + " by falling back to LIST of base name '" +
                      std::string(base) + "'.");
            ir_schema* item = resolve(base, raw);
            if (!item->from_unresolved_ref) {
                ir_schema* list = ctx_.store().insert_or_get(ref_name);
                list->type = "array";
                list->items = item;
                return list;
            }
        }
    }

    for (auto suffix : kStrippableSuffixes) {
        if (ref_name.size() <= suffix.size() || !ref_name.ends_with(suffix)) {
            continue;
        }
        std::string_view base = ref_name.substr(0, ref_name.size() - suffix.size());
        const json_value* raw = ctx_.raw_schema(base);
        if (!raw) {
            break;
        }
        ctx_.warn("Resolved $ref: " + std::string(ref) + " by falling back to stripped name '" +
                  std::string(base) + "'.");
        ir_schema* base_schema = resolve(base, raw);
        ir_schema* copy = ctx_.store().insert_or_get(ref_name);
        if (base_schema->from_unresolved_ref) {
            copy->from_unresolved_ref = true;
            return copy;
        }
        *copy = *base_schema;
        copy->name = std::string(ref_name);
        copy->generation_name.reset();
        copy->final_module_stem.reset();
        return copy;
    }

    ctx_.warn("Could not resolve $ref: " + std::string(ref));
    return unresolved_placeholder(ref_name);
}

ir_schema* schema_resolver::cycle_placeholder(std::string_view name, const std::string& path) {
    ir_schema* slot = ctx_.store().insert_or_get(name);
    slot->is_circular_ref = true;
    slot->circular_ref_path = path;
    if (!slot->type && !slot->description) {
        slot->type = "object";
        slot->description = "[Circular reference detected: " + path + "]";
        slot->placeholder = placeholder_kind::cycle;
    }
    return slot;
}

ir_schema* schema_resolver::depth_placeholder(std::optional<std::string_view> name, size_t limit) {
    const std::string display = name ? std::string(*name) : std::string("<anonymous_schema>");
    ctx_.warn("Maximum recursion depth (" + std::to_string(limit) +
              ") exceeded while parsing schema '" + display + "'");

    if (name && ctx_.is_parsing(*name)) {
        // the canonical slot is still being filled further up the stack
        ir_schema* slot = ctx_.store().insert_or_get(*name);
        slot->is_circular_ref = true;
        slot->circular_ref_path = "MAX_DEPTH_EXCEEDED: " + display;
        return slot;
    }

    ir_schema* s = name ? ctx_.store().insert_or_get(*name) : ctx_.store().make();
    s->type = "object";
    s->description =
        "[Maximum recursion depth (" + std::to_string(limit) + ") exceeded for '" + display + "']";
    s->is_circular_ref = true;
    s->from_unresolved_ref = true;
    s->circular_ref_path = "MAX_DEPTH_EXCEEDED: " + display;
    s->placeholder = placeholder_kind::max_depth;
    return s;
}

ir_schema* schema_resolver::unresolved_placeholder(std::string_view name) {
    ir_schema* s = ctx_.store().make();
    if (!name.empty()) {
        s->name = std::string(name);
    }
    s->from_unresolved_ref = true;
    s->placeholder = placeholder_kind::unresolved_ref;
    return s;
}

} // namespace specir::openapi
