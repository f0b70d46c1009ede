#include "specir/core/inline_promoter.hpp"

#include "specir/core/name_sanitizer.hpp"
#include "specir/core/parsing_context.hpp"

#include <array>
#include <iostream>

namespace specir::openapi {

namespace {

constexpr std::array<std::string_view, 6> kEntitySuffixes = {
    "Item", "Data", "Info", "Object", "Record", "Entry"};

bool has_id_like_property(const ir_schema& s) noexcept {
    for (const auto& [key, prop] : s.properties) {
        if (key == "id" || key.ends_with("Id")) {
            return true;
        }
    }
    return false;
}

bool reads_as_entity(std::string_view name) noexcept {
    for (auto suffix : kEntitySuffixes) {
        if (name.ends_with(suffix)) {
            return true;
        }
    }
    return false;
}

// A name is free if nothing is registered under it (or it is this instance), and no
// component that is still waiting to be parsed claims it.
bool name_available(const parsing_context& ctx, const std::string& name, const ir_schema& s) {
    if (const ir_schema* existing = ctx.store().find(name)) {
        return existing == &s;
    }
    return ctx.raw_schema(name) == nullptr;
}

} // namespace

std::string choose_promoted_name(const parsing_context& ctx,
                                 std::optional<std::string_view> parent_name,
                                 std::string_view property_key,
                                 const ir_schema& property) {
    std::string key_name = sanitize_class_name(property_key);
    if (key_name.size() > 2 && key_name.back() == 's') {
        key_name.pop_back();
    }
    if (!reads_as_entity(key_name) && !has_id_like_property(property)) {
        key_name += "Data";
    }

    std::string parent_plus_key =
        parent_name ? sanitize_class_name(std::string(*parent_name) + key_name) : key_name;

    if (name_available(ctx, key_name, property)) {
        return key_name;
    }
    if (name_available(ctx, parent_plus_key, property)) {
        return parent_plus_key;
    }
    for (size_t counter = 1;; ++counter) {
        std::string candidate = parent_plus_key + std::to_string(counter);
        if (name_available(ctx, candidate, property)) {
            return candidate;
        }
    }
}

ir_schema* promote_inline_object(parsing_context& ctx,
                                 std::optional<std::string_view> parent_name,
                                 std::string_view property_key,
                                 ir_schema* property) {
    if (!property || property->type != "object" || property->enum_values ||
        property->from_unresolved_ref || property->name || property->is_placeholder()) {
        return nullptr;
    }

    std::string chosen = choose_promoted_name(ctx, parent_name, property_key, *property);
    property->name = chosen;
    if (!ctx.store().insert(chosen, property)) {
        // choose_promoted_name only returns free names
        std::cerr << "[specir][promote] name '" << chosen << "' taken during promotion\n";
        property->name.reset();
        return nullptr;
    }

    ir_schema* slot = ctx.store().make();
    slot->name = std::string(property_key);
    slot->type = chosen;
    slot->description = property->description;
    slot->is_nullable = property->is_nullable;
    slot->refers_to = property;
    return slot;
}

} // namespace specir::openapi
