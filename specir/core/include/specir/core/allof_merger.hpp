#pragma once

#include "ir.hpp"

#include <vector>

namespace specir::openapi {

struct all_of_merge {
    property_list properties;
    name_set required;
    std::vector<ir_schema*> members;
};

// Flattens already-resolved allOf members. Properties are unioned with the first
// definition winning, required is unioned, and sibling properties/required declared next
// to allOf override the merged result. Members are kept as-is for provenance.
all_of_merge merge_all_of(std::vector<ir_schema*> members,
                          const property_list& sibling_properties = {},
                          const name_set& sibling_required = {});

} // namespace specir::openapi
