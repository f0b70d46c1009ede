#include "options.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace specir_gen {

[[noreturn]] void print_usage() {
    std::cout << R"(specir_gen - OpenAPI to cycle-safe IR pipeline

Usage:
  specir_gen ir -i <spec> [-o <out_dir>] [options]
  specir_gen examples

Options:
  -i, --input <file>         OpenAPI specification path (JSON/YAML)
  -o, --output <dir>         Output directory for --dump-ir (default: .)
  --max-depth <n>            Schema recursion limit (default: SPECIR_MAX_DEPTH or 100)
  --debug-cycles             Log every detected reference cycle
  --json                     Print the IR summary as JSON
  --check                    Load and report counts only
  --types                    Print resolved property types and imports per schema
  --strict                   Exit non-zero when any warning was produced
  --dump-ir                  Save the IR summary to ir.json
  -h, --help                 Show this help

Environment:
  SPECIR_MAX_DEPTH, SPECIR_DEBUG_CYCLES, SPECIR_MAX_CYCLES
)";
    std::exit(1);
}

[[noreturn]] void print_examples() {
    std::cout << R"(specir_gen examples:

  # Load a spec and fail on any warning
  specir_gen ir -i api/openapi.yaml --check --strict

  # Show the Python types every schema property resolves to
  specir_gen ir -i api/openapi.yaml --types

  # Trace reference cycles with a tighter depth limit
  specir_gen ir -i api/openapi.json --max-depth 32 --debug-cycles

  # Dump the IR for debugging
  specir_gen ir -i api/openapi.yaml -o build/ir --dump-ir --json
)";
    std::exit(0);
}

namespace {

size_t parse_depth(std::string_view arg) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
    if (ec != std::errc{} || ptr != arg.data() + arg.size() || value == 0) {
        std::cerr << "Invalid --max-depth value: " << arg << "\n";
        print_usage();
    }
    return value;
}

} // namespace

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage();
    }
    if (opts.subcommand == "examples") {
        print_examples();
    }
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-i" || arg == "--input") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.input = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.output = argv[++i];
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.max_depth = parse_depth(argv[++i]);
        } else if (arg == "--debug-cycles") {
            opts.debug_cycles = true;
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--dump-ir") {
            opts.dump_ir = true;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--check") {
            opts.check_only = true;
        } else if (arg == "--types") {
            opts.types = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace specir_gen
