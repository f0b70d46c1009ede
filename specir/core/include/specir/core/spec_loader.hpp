#pragma once

#include "ir.hpp"
#include "json_value.hpp"
#include "parsing_context.hpp"
#include "result.hpp"

#include <string_view>

namespace specir::openapi {

// Decodes JSON (input starting with '{' or '[') or the YAML subset, then runs load_ir.
result<ir_spec> load_from_string(std::string_view spec_text,
                                 parse_options opts = parse_options::from_env());
result<ir_spec> load_from_file(const char* path, parse_options opts = parse_options::from_env());

// Builds the IR from a decoded document: info and servers, component schemas,
// operations, then the extraction, discriminator and naming passes.
result<ir_spec> load_ir(const serde::json_value& document,
                        parse_options opts = parse_options::from_env());

} // namespace specir::openapi
