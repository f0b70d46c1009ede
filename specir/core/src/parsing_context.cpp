#include "specir/core/parsing_context.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace specir::openapi {

namespace {

size_t read_size(const char* env_name, size_t fallback) {
    if (const char* value = std::getenv(env_name)) {
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(value, &end, 10);
        if (end != value && *end == '\0') {
            return static_cast<size_t>(parsed);
        }
    }
    return fallback;
}

bool read_flag(const char* env_name, bool fallback) {
    if (const char* value = std::getenv(env_name)) {
        std::string_view v(value);
        return v == "1" || v == "true" || v == "yes" || v == "TRUE" || v == "YES";
    }
    return fallback;
}

const serde::json_value* component_map(const serde::json_value* components,
                                       std::string_view key) noexcept {
    if (!components) {
        return nullptr;
    }
    const serde::json_value* map = components->find(key);
    return (map && map->is_object()) ? map : nullptr;
}

const serde::json_value* lookup(const serde::json_value* map, std::string_view name) noexcept {
    return map ? map->find(name) : nullptr;
}

} // namespace

parse_options parse_options::from_env() {
    parse_options opts;
    opts.max_depth = read_size("SPECIR_MAX_DEPTH", kDefaultMaxDepth);
    opts.debug_cycles = read_flag("SPECIR_DEBUG_CYCLES", false);
    opts.max_cycles = read_size("SPECIR_MAX_CYCLES", 0);
    return opts;
}

parsing_context::parsing_context(parse_options opts)
    : options_(opts), store_(std::make_unique<schema_store>()) {}

parsing_context::parsing_context(const serde::json_value& document, parse_options opts)
    : parsing_context(opts) {
    bind_document(document);
}

void parsing_context::bind_document(const serde::json_value& document) noexcept {
    const serde::json_value* components = document.find("components");
    if (components && !components->is_object()) {
        components = nullptr;
    }
    raw_schemas_ = component_map(components, "schemas");
    raw_parameters_ = component_map(components, "parameters");
    raw_responses_ = component_map(components, "responses");
    raw_request_bodies_ = component_map(components, "requestBodies");
}

guard_verdict parsing_context::enter_schema(std::optional<std::string_view> name) {
    ++depth_;
    max_depth_reached_ = std::max(max_depth_reached_, depth_);
    if (depth_ > options_.max_depth) {
        return depth_exceeded{depth_, options_.max_depth};
    }
    if (!name) {
        return guard_proceed{};
    }
    if (is_parsing(*name)) {
        cycle_detected_ = true;
        std::string path;
        for (const auto& entry : path_) {
            path += entry;
            path += " -> ";
        }
        path += *name;
        note_cycle(path);
        return cycle_hit{std::move(path)};
    }
    path_.emplace_back(*name);
    return guard_proceed{};
}

void parsing_context::exit_schema(std::optional<std::string_view> name) noexcept {
    if (depth_ > 0) {
        --depth_;
    }
    if (!name) {
        return;
    }
    auto it = std::find(path_.rbegin(), path_.rend(), *name);
    if (it != path_.rend()) {
        path_.erase(std::next(it).base());
    }
}

bool parsing_context::is_parsing(std::string_view name) const noexcept {
    return std::find(path_.begin(), path_.end(), name) != path_.end();
}

void parsing_context::note_cycle(const std::string& path) {
    ++cycles_;
    if (!options_.debug_cycles) {
        return;
    }
    if (options_.max_cycles != 0 && cycles_ > options_.max_cycles) {
        if (cycles_ == options_.max_cycles + 1) {
            std::cerr << "[specir][cycle] limit of " << options_.max_cycles
                      << " cycle reports reached, further cycles are not logged\n";
        }
        return;
    }
    std::cerr << "[specir][cycle] " << path << "\n";
}

void parsing_context::warn(std::string message) {
    warnings_.push_back(std::move(message));
}

std::vector<std::string> parsing_context::take_warnings() noexcept {
    std::vector<std::string> out;
    out.swap(warnings_);
    return out;
}

const serde::json_value* parsing_context::raw_schema(std::string_view name) const noexcept {
    return lookup(raw_schemas_, name);
}

const serde::json_value* parsing_context::raw_parameter(std::string_view name) const noexcept {
    return lookup(raw_parameters_, name);
}

const serde::json_value* parsing_context::raw_response(std::string_view name) const noexcept {
    return lookup(raw_responses_, name);
}

const serde::json_value*
parsing_context::raw_request_body(std::string_view name) const noexcept {
    return lookup(raw_request_bodies_, name);
}

std::unique_ptr<schema_store> parsing_context::release_store() {
    auto out = std::move(store_);
    store_ = std::make_unique<schema_store>();
    return out;
}

void parsing_context::reset() {
    store_ = std::make_unique<schema_store>();
    path_.clear();
    depth_ = 0;
    max_depth_reached_ = 0;
    cycles_ = 0;
    cycle_detected_ = false;
    warnings_.clear();
}

schema_scope::schema_scope(parsing_context& ctx, std::optional<std::string_view> name)
    : ctx_(ctx), verdict_(ctx.enter_schema(name)) {
    if (name && std::holds_alternative<guard_proceed>(verdict_)) {
        pushed_ = std::string(*name);
    }
}

schema_scope::~schema_scope() {
    ctx_.exit_schema(pushed_ ? std::optional<std::string_view>(*pushed_) : std::nullopt);
}

} // namespace specir::openapi
