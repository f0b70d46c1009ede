#include "specir/core/parsing_context.hpp"
#include "specir/core/schema_store.hpp"
#include "specir/core/spec_loader.hpp"
#include "specir_gen/generator.hpp"
#include "specir_gen/options.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using specir::openapi::ir_spec;
using specir::openapi::parse_options;
using namespace specir_gen;

namespace {

int run_ir(const options& opts) {
    if (opts.input.empty()) {
        std::cerr << "[specir] input spec is required\n";
        return 1;
    }

    parse_options popts = parse_options::from_env();
    if (opts.max_depth) {
        popts.max_depth = *opts.max_depth;
    }
    if (opts.debug_cycles) {
        popts.debug_cycles = true;
    }

    auto loaded = specir::openapi::load_from_file(opts.input.c_str(), popts);
    if (!loaded) {
        std::cerr << "[specir] " << loaded.error().message() << "\n";
        return 1;
    }

    ir_spec& spec = *loaded;

    std::vector<std::string> warnings = spec.warnings;
    std::string types;
    if (opts.types) {
        types = type_report(spec, warnings);
    }
    for (const auto& w : warnings) {
        std::cerr << "[specir][warn] " << w << "\n";
    }

    if (opts.json_output) {
        std::cout << dump_ir_summary(spec) << "\n";
    }

    if (opts.check_only) {
        std::cout << "[check] OK: title=" << spec.title << ", schemas=" << spec.schemas->size()
                  << ", operations=" << spec.operations.size()
                  << ", warnings=" << warnings.size() << "\n";
        return (opts.strict && !warnings.empty()) ? 1 : 0;
    }

    if (opts.types) {
        std::cout << types;
    }

    if (opts.dump_ir) {
        std::error_code fs_ec;
        fs::create_directories(opts.output, fs_ec);
        if (fs_ec) {
            std::cerr << "[specir] failed to create output dir: " << fs_ec.message() << "\n";
            return 1;
        }
        auto out_path = opts.output / "ir.json";
        std::ofstream out(out_path, std::ios::binary);
        if (!out) {
            std::cerr << "[specir] failed to write " << out_path << "\n";
            return 1;
        }
        out << dump_ir_summary(spec);
        std::cout << "[specir] IR summary written to " << out_path << "\n";
    }

    std::cout << "[specir] OK: title=" << spec.title << ", schemas=" << spec.schemas->size()
              << ", operations=" << spec.operations.size() << ", warnings=" << warnings.size()
              << "\n";
    if (opts.strict && !warnings.empty()) {
        std::cerr << "[specir] strict mode: " << warnings.size() << " warning(s)\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand != "ir") {
        std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
        print_usage();
    }
    return run_ir(opts);
}
