#pragma once

#include "ir.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace specir::openapi {

class schema_store;

// Unifies the per-variant discriminator enums of every discriminated union (a schema
// with a discriminator and a oneOf/anyOf list) into one {Union}{Property}Enum.
class discriminator_enum_collector {
public:
    explicit discriminator_enum_collector(schema_store& store) noexcept : store_(store) {}

    // (variant, property) pairs that inline enum extraction must leave alone.
    [[nodiscard]] schema_property_set identify_discriminator_properties() const;

    // Builds and registers the unified enums and rebinds each variant's discriminator
    // slot. A union that fails is logged and skipped.
    const std::vector<unified_discriminator_enum>& collect_unified_enums();

    [[nodiscard]] bool should_skip_enum(std::string_view name) const noexcept {
        return skip_list_.contains(name);
    }
    [[nodiscard]] const name_set& skip_list() const noexcept { return skip_list_; }
    [[nodiscard]] const std::vector<unified_discriminator_enum>& unified_enums() const noexcept {
        return unified_;
    }
    std::vector<std::string> take_warnings() noexcept { return std::move(warnings_); }

    static std::string unified_enum_name(std::string_view union_name, std::string_view property);
    static std::string member_name(const enum_value& value);

private:
    void process_union(const std::string& union_name, const ir_schema& union_schema);
    [[nodiscard]] ir_schema* variant_schema(ir_schema* variant) const noexcept;
    [[nodiscard]] bool referenced_outside(const ir_schema* target,
                                          const std::vector<ir_schema*>& variants) const;

    schema_store& store_;
    std::vector<unified_discriminator_enum> unified_;
    name_set skip_list_;
    std::vector<std::string> warnings_;
};

} // namespace specir::openapi
