#pragma once

#include "specir/core/ir.hpp"

#include <string>
#include <vector>

namespace specir_gen {

using specir::openapi::ir_spec;

// JSON summary of the IR: info, schemas with their flags, operations, unified enums.
std::string dump_ir_summary(const ir_spec& spec);

// Per emitted schema: module stem, resolved type of each property and the import lines
// its module would need. Resolver warnings are appended to warnings.
std::string type_report(const ir_spec& spec, std::vector<std::string>& warnings);

} // namespace specir_gen
