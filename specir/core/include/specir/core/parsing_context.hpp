#pragma once

#include "json_value.hpp"
#include "schema_store.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace specir::openapi {

constexpr size_t kDefaultMaxDepth = 100;

struct parse_options {
    size_t max_depth = kDefaultMaxDepth;
    bool debug_cycles = false; // log every cycle event to stderr
    size_t max_cycles = 0;     // stop cycle logging after N events (0 = unlimited)

    // Defaults overridden by SPECIR_MAX_DEPTH, SPECIR_DEBUG_CYCLES and SPECIR_MAX_CYCLES.
    static parse_options from_env();
};

struct guard_proceed {};

struct cycle_hit {
    std::string path;
};

struct depth_exceeded {
    size_t depth = 0;
    size_t limit = 0;
};

using guard_verdict = std::variant<guard_proceed, cycle_hit, depth_exceeded>;

// Per-run mutable state shared by the resolver and the post-passes. One traversal at a
// time; reset() makes the context reusable for another document.
class parsing_context {
public:
    explicit parsing_context(parse_options opts = parse_options::from_env());
    explicit parsing_context(const serde::json_value& document,
                             parse_options opts = parse_options::from_env());

    parsing_context(const parsing_context&) = delete;
    parsing_context& operator=(const parsing_context&) = delete;

    // Points the raw component maps at document["components"].
    void bind_document(const serde::json_value& document) noexcept;

    // Depth always increments. A named entry is pushed unless it is already on the stack.
    guard_verdict enter_schema(std::optional<std::string_view> name);
    // Depth always decrements. Removes the most recent occurrence of name, if any.
    void exit_schema(std::optional<std::string_view> name) noexcept;

    [[nodiscard]] bool is_parsing(std::string_view name) const noexcept;
    [[nodiscard]] const std::vector<std::string>& parsing_path() const noexcept { return path_; }
    [[nodiscard]] size_t depth() const noexcept { return depth_; }
    [[nodiscard]] size_t max_depth_reached() const noexcept { return max_depth_reached_; }
    [[nodiscard]] bool cycle_detected() const noexcept { return cycle_detected_; }
    [[nodiscard]] size_t cycle_count() const noexcept { return cycles_; }

    void warn(std::string message);
    [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }
    std::vector<std::string> take_warnings() noexcept;

    [[nodiscard]] const serde::json_value* raw_schemas() const noexcept { return raw_schemas_; }
    [[nodiscard]] const serde::json_value* raw_schema(std::string_view name) const noexcept;
    [[nodiscard]] const serde::json_value* raw_parameter(std::string_view name) const noexcept;
    [[nodiscard]] const serde::json_value* raw_response(std::string_view name) const noexcept;
    [[nodiscard]] const serde::json_value* raw_request_body(std::string_view name) const noexcept;

    [[nodiscard]] schema_store& store() noexcept { return *store_; }
    [[nodiscard]] const schema_store& store() const noexcept { return *store_; }
    // Hands the arena to the caller; the context continues with an empty one.
    std::unique_ptr<schema_store> release_store();

    [[nodiscard]] const parse_options& options() const noexcept { return options_; }
    void set_options(parse_options opts) noexcept { options_ = opts; }

    void reset();

private:
    void note_cycle(const std::string& path);

    parse_options options_;
    const serde::json_value* raw_schemas_ = nullptr;
    const serde::json_value* raw_parameters_ = nullptr;
    const serde::json_value* raw_responses_ = nullptr;
    const serde::json_value* raw_request_bodies_ = nullptr;
    std::unique_ptr<schema_store> store_;
    std::vector<std::string> path_;
    size_t depth_ = 0;
    size_t max_depth_reached_ = 0;
    size_t cycles_ = 0;
    bool cycle_detected_ = false;
    std::vector<std::string> warnings_;
};

// Pairs enter_schema/exit_schema for one resolution step.
class schema_scope {
public:
    schema_scope(parsing_context& ctx, std::optional<std::string_view> name);
    ~schema_scope();

    schema_scope(const schema_scope&) = delete;
    schema_scope& operator=(const schema_scope&) = delete;

    [[nodiscard]] const guard_verdict& verdict() const noexcept { return verdict_; }

private:
    parsing_context& ctx_;
    std::optional<std::string> pushed_;
    guard_verdict verdict_;
};

} // namespace specir::openapi
