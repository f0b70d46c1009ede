#include "specir/core/discriminator_enum_collector.hpp"

#include "specir/core/name_sanitizer.hpp"
#include "specir/core/schema_store.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <map>

namespace specir::openapi {

namespace {

bool is_discriminated_union(const ir_schema& s) noexcept {
    if (!s.discriminator || s.discriminator->property_name.empty()) {
        return false;
    }
    return (s.one_of && !s.one_of->empty()) || (s.any_of && !s.any_of->empty());
}

const std::vector<ir_schema*>& variants_of(const ir_schema& s) noexcept {
    return (s.one_of && !s.one_of->empty()) ? *s.one_of : *s.any_of;
}

bool references(const ir_schema& owner, const ir_schema* target) noexcept {
    if (owner.items == target || owner.additional_properties == target) {
        return true;
    }
    for (const auto& [key, prop] : owner.properties) {
        if (prop == target || (prop && prop->refers_to == target)) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string discriminator_enum_collector::unified_enum_name(std::string_view union_name,
                                                            std::string_view property) {
    std::string base(union_name);
    if (base.ends_with("Enum")) {
        base.resize(base.size() - 4);
    }
    return sanitize_class_name(base + capitalize_first(property) + "Enum");
}

std::string discriminator_enum_collector::member_name(const enum_value& value) {
    std::string name = enum_value_to_string(value);
    for (auto& c : name) {
        if (c == '-' || c == ' ') {
            c = '_';
        } else {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return name;
}

ir_schema* discriminator_enum_collector::variant_schema(ir_schema* variant) const noexcept {
    if (!variant) {
        return nullptr;
    }
    if (variant->name) {
        if (ir_schema* registered = store_.find(*variant->name)) {
            return registered;
        }
    }
    return variant;
}

schema_property_set discriminator_enum_collector::identify_discriminator_properties() const {
    schema_property_set out;
    for (const auto& [name, s] : store_) {
        if (!s || !is_discriminated_union(*s)) {
            continue;
        }
        for (ir_schema* variant : variants_of(*s)) {
            ir_schema* resolved = variant_schema(variant);
            if (resolved && resolved->name) {
                out.emplace(*resolved->name, s->discriminator->property_name);
            }
        }
    }
    return out;
}

const std::vector<unified_discriminator_enum>& discriminator_enum_collector::collect_unified_enums() {
    std::vector<std::pair<std::string, ir_schema*>> snapshot(store_.begin(), store_.end());
    for (const auto& [name, s] : snapshot) {
        if (!s || !is_discriminated_union(*s)) {
            continue;
        }
        try {
            process_union(name, *s);
        } catch (const std::exception& e) {
            std::cerr << "[specir][discriminator] failed to process union '" << name
                      << "': " << e.what() << "\n";
            warnings_.push_back("Failed to process discriminated union '" + name +
                                "': " + e.what() + ". Skipping.");
        }
    }
    return unified_;
}

bool discriminator_enum_collector::referenced_outside(
    const ir_schema* target, const std::vector<ir_schema*>& variants) const {
    for (const auto& [name, s] : store_) {
        if (!s || s == target ||
            std::find(variants.begin(), variants.end(), s) != variants.end()) {
            continue;
        }
        if (references(*s, target)) {
            return true;
        }
    }
    return false;
}

void discriminator_enum_collector::process_union(const std::string& union_name,
                                                 const ir_schema& union_schema) {
    const std::string& property = union_schema.discriminator->property_name;

    std::map<std::string, std::string, std::less<>> value_by_variant;
    for (const auto& [ref, value] : union_schema.discriminator->mapping) {
        auto pos = ref.rfind('/');
        value_by_variant.emplace(pos == std::string::npos ? ref : ref.substr(pos + 1), value);
    }

    std::vector<ir_schema*> variants;
    for (ir_schema* variant : variants_of(union_schema)) {
        if (ir_schema* resolved = variant_schema(variant)) {
            variants.push_back(resolved);
        }
    }

    auto is_unified = [this](const std::string& name) {
        return std::any_of(
            unified_.begin(), unified_.end(), [&](const auto& u) { return u.name == name; });
    };

    std::vector<std::pair<std::string, enum_value>> members;
    std::vector<const ir_schema*> variant_enums;
    for (ir_schema* variant : variants) {
        const ir_schema* prop = variant->property(property);
        if (!prop) {
            continue;
        }

        const std::vector<enum_value>* values = nullptr;
        const ir_schema* source = nullptr;
        if (prop->enum_values && !prop->enum_values->empty()) {
            values = &*prop->enum_values;
            if (prop->name && store_.find(*prop->name) == prop) {
                source = prop;
            }
        } else if (prop->refers_to && prop->refers_to->enum_values &&
                   !prop->refers_to->enum_values->empty()) {
            source = prop->refers_to;
            values = &*source->enum_values;
        } else if (prop->type) {
            const ir_schema* named = store_.find(*prop->type);
            if (named && named->enum_values && !named->enum_values->empty()) {
                source = named;
                values = &*named->enum_values;
            }
        }

        std::vector<enum_value> from_mapping;
        if (!values && variant->name) {
            if (auto it = value_by_variant.find(*variant->name); it != value_by_variant.end()) {
                from_mapping.emplace_back(it->second);
                values = &from_mapping;
            }
        }
        if (!values) {
            continue;
        }

        for (const auto& v : *values) {
            members.emplace_back(member_name(v), v);
        }
        // a variant shared with an earlier union already points at that union's enum
        if (source && source->name && !is_unified(*source->name)) {
            variant_enums.push_back(source);
        }
    }

    if (members.empty()) {
        std::cerr << "[specir][discriminator] no discriminator values for union '" << union_name
                  << "'\n";
        return;
    }

    const std::string unified_name = unified_enum_name(union_name, property);
    ir_schema* unified = store_.insert_or_get(unified_name);
    unified->type = std::holds_alternative<int64_t>(members.front().second) ? "integer" : "string";
    unified->enum_values.emplace();
    for (const auto& [member, value] : members) {
        unified->enum_values->push_back(value);
    }
    unified->description = "Discriminator enum for " + union_name + " union types.";
    unified->assign_generation_name(unified_name, sanitize_module_name(unified_name));

    unified_discriminator_enum record;
    record.name = unified_name;
    record.property_name = property;
    record.union_name = union_name;
    record.members = std::move(members);
    record.description = *unified->description;

    for (ir_schema* variant : variants) {
        const ir_schema* old = variant->property(property);
        if (!old) {
            continue;
        }
        ir_schema* slot = store_.make();
        slot->name = unified_name;
        slot->type = unified_name;
        slot->description = old->description;
        slot->is_nullable = old->is_nullable;
        slot->refers_to = unified;
        slot->assign_generation_name(unified_name, *unified->final_module_stem);
        variant->replace_property(property, slot);
    }

    for (const ir_schema* old_enum : variant_enums) {
        const std::string& old_name = *old_enum->name;
        if (old_name == unified_name) {
            continue;
        }
        if (referenced_outside(old_enum, variants)) {
            continue;
        }
        record.skipped_variant_enums.insert(old_name);
        if (store_.find(old_name) == old_enum) {
            store_.erase(old_name);
        }
    }
    skip_list_.insert(record.skipped_variant_enums.begin(), record.skipped_variant_enums.end());

    auto existing = std::find_if(unified_.begin(), unified_.end(), [&](const auto& u) {
        return u.name == unified_name;
    });
    if (existing != unified_.end()) {
        *existing = std::move(record);
    } else {
        unified_.push_back(std::move(record));
    }
}

} // namespace specir::openapi
