#include "specir/core/ir.hpp"

#include "specir/core/schema_store.hpp"

#include <sstream>

namespace specir::openapi {

ir_schema* ir_schema::property(std::string_view key) const noexcept {
    for (const auto& [prop_name, prop] : properties) {
        if (prop_name == key) {
            return prop;
        }
    }
    return nullptr;
}

bool ir_schema::replace_property(std::string_view key, ir_schema* replacement) noexcept {
    for (auto& [prop_name, prop] : properties) {
        if (prop_name == key) {
            prop = replacement;
            return true;
        }
    }
    return false;
}

bool ir_schema::assign_generation_name(std::string generation, std::string module_stem) {
    if (generation_name) {
        return *generation_name == generation;
    }
    generation_name = std::move(generation);
    final_module_stem = std::move(module_stem);
    return true;
}

ir_spec::ir_spec() : schemas(std::make_unique<schema_store>()) {}
ir_spec::~ir_spec() = default;
ir_spec::ir_spec(ir_spec&&) noexcept = default;
ir_spec& ir_spec::operator=(ir_spec&&) noexcept = default;

const ir_schema* ir_spec::schema(std::string_view name) const noexcept {
    return schemas ? schemas->find(name) : nullptr;
}

std::string_view http_method_name(http_method m) noexcept {
    switch (m) {
    case http_method::get:
        return "GET";
    case http_method::put:
        return "PUT";
    case http_method::post:
        return "POST";
    case http_method::del:
        return "DELETE";
    case http_method::options:
        return "OPTIONS";
    case http_method::head:
        return "HEAD";
    case http_method::patch:
        return "PATCH";
    case http_method::trace:
        return "TRACE";
    }
    return "GET";
}

std::optional<http_method> http_method_from_string(std::string_view sv) noexcept {
    if (sv == "get")
        return http_method::get;
    if (sv == "put")
        return http_method::put;
    if (sv == "post")
        return http_method::post;
    if (sv == "delete")
        return http_method::del;
    if (sv == "options")
        return http_method::options;
    if (sv == "head")
        return http_method::head;
    if (sv == "patch")
        return http_method::patch;
    if (sv == "trace")
        return http_method::trace;
    return std::nullopt;
}

std::string_view param_location_name(param_location loc) noexcept {
    switch (loc) {
    case param_location::path:
        return "path";
    case param_location::query:
        return "query";
    case param_location::header:
        return "header";
    case param_location::cookie:
        return "cookie";
    }
    return "query";
}

std::optional<param_location> param_location_from_string(std::string_view sv) noexcept {
    if (sv == "path")
        return param_location::path;
    if (sv == "query")
        return param_location::query;
    if (sv == "header")
        return param_location::header;
    if (sv == "cookie")
        return param_location::cookie;
    return std::nullopt;
}

std::string enum_value_to_string(const enum_value& v) {
    struct visitor {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream os;
            os << d;
            return os.str();
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(visitor{}, v);
}

} // namespace specir::openapi
