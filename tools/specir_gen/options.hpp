#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace specir_gen {

struct options {
    std::string subcommand;
    std::string input;
    std::filesystem::path output = ".";
    std::optional<size_t> max_depth; // overrides SPECIR_MAX_DEPTH
    bool debug_cycles = false;
    bool strict = false;
    bool dump_ir = false;
    bool json_output = false;
    bool check_only = false;
    bool types = false;
};

[[noreturn]] void print_usage();
[[noreturn]] void print_examples();
options parse_args(int argc, char** argv);

} // namespace specir_gen
