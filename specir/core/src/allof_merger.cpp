#include "specir/core/allof_merger.hpp"

#include <algorithm>

namespace specir::openapi {

namespace {

property_list::iterator find_property(property_list& props, std::string_view key) {
    return std::find_if(
        props.begin(), props.end(), [key](const auto& entry) { return entry.first == key; });
}

} // namespace

all_of_merge merge_all_of(std::vector<ir_schema*> members,
                          const property_list& sibling_properties,
                          const name_set& sibling_required) {
    all_of_merge out;
    out.required = sibling_required;

    for (ir_schema* member : members) {
        if (!member) {
            continue;
        }
        for (const auto& [key, prop] : member->properties) {
            if (find_property(out.properties, key) == out.properties.end()) {
                out.properties.emplace_back(key, prop);
            }
        }
        out.required.insert(member->required.begin(), member->required.end());
    }

    for (const auto& [key, prop] : sibling_properties) {
        auto it = find_property(out.properties, key);
        if (it != out.properties.end()) {
            it->second = prop;
        } else {
            out.properties.emplace_back(key, prop);
        }
    }

    out.members = std::move(members);
    return out;
}

} // namespace specir::openapi
