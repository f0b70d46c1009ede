#include "specir/core/inline_promoter.hpp"

#include "specir/core/name_sanitizer.hpp"
#include "specir/core/schema_store.hpp"

#include <deque>
#include <map>
#include <utility>
#include <vector>

namespace specir::openapi {

namespace {

bool is_complex_item(const ir_schema& item) noexcept {
    if (item.name || item.is_placeholder() || item.enum_values) {
        return false;
    }
    return (item.type == "object" && !item.properties.empty()) || item.type == "array" ||
           item.has_composition();
}

std::string joined_class_name(std::string_view schema, std::string_view prop) {
    std::string raw(schema);
    raw += '_';
    raw += prop;
    return sanitize_class_name(raw);
}

// Registers item under {base}Item (with a counter) and returns true when it did.
bool name_item(schema_store& store, ir_schema& item, const std::string& base) {
    std::string name = unique_schema_name(store, base + "Item", &item);
    item.name = name;
    return store.insert(name, &item);
}

} // namespace

std::string unique_schema_name(const schema_store& store,
                               const std::string& base,
                               const ir_schema* instance) {
    auto available = [&](const std::string& candidate) {
        const ir_schema* existing = store.find(candidate);
        return !existing || existing == instance;
    };
    if (available(base)) {
        return base;
    }
    for (size_t counter = 1;; ++counter) {
        std::string candidate = base + std::to_string(counter);
        if (available(candidate)) {
            return candidate;
        }
    }
}

size_t extract_inline_array_items(schema_store& store) {
    std::deque<std::pair<std::string, ir_schema*>> pending(store.begin(), store.end());
    size_t registered = 0;

    while (!pending.empty()) {
        auto [schema_name, s] = pending.front();
        pending.pop_front();
        if (!s || s->is_placeholder()) {
            continue;
        }

        if (s->type == "array" && s->items && is_complex_item(*s->items)) {
            if (name_item(store, *s->items, sanitize_class_name(schema_name))) {
                ++registered;
                pending.emplace_back(*s->items->name, s->items);
            }
        }

        for (const auto& [key, prop] : s->properties) {
            if (!prop || prop->name || prop->type != "array" || !prop->items ||
                !is_complex_item(*prop->items)) {
                continue;
            }
            if (name_item(store, *prop->items, joined_class_name(schema_name, key))) {
                ++registered;
                pending.emplace_back(*prop->items->name, prop->items);
            }
        }
    }
    return registered;
}

size_t extract_inline_enums(schema_store& store, const schema_property_set& skip) {
    std::vector<std::pair<std::string, ir_schema*>> snapshot(store.begin(), store.end());
    std::map<const ir_schema*, ir_schema*> extracted;
    size_t registered = 0;

    for (const auto& [schema_name, s] : snapshot) {
        if (!s || s->is_placeholder()) {
            continue;
        }
        for (auto& [key, prop] : s->properties) {
            if (!prop || prop->name || prop->refers_to || !prop->enum_values ||
                prop->enum_values->empty()) {
                continue;
            }
            if (skip.contains({schema_name, key})) {
                continue;
            }

            ir_schema* enum_schema = nullptr;
            if (auto it = extracted.find(prop); it != extracted.end()) {
                enum_schema = it->second;
            } else {
                enum_schema = store.make();
                std::string name =
                    unique_schema_name(store, joined_class_name(schema_name, key) + "Enum");
                enum_schema->name = name;
                enum_schema->type = prop->type ? prop->type : std::optional<std::string>("string");
                enum_schema->format = prop->format;
                enum_schema->enum_values = prop->enum_values;
                enum_schema->description =
                    prop->description ? *prop->description
                                      : "Enum for " + schema_name + "." + key;
                store.insert(name, enum_schema);
                extracted.emplace(prop, enum_schema);
                ++registered;
            }

            ir_schema* slot = store.make();
            slot->name = key;
            slot->type = *enum_schema->name;
            slot->description = prop->description;
            slot->is_nullable = prop->is_nullable;
            slot->refers_to = enum_schema;
            prop = slot;
        }
    }
    return registered;
}

} // namespace specir::openapi
