#include "specir/core/spec_loader.hpp"

#include "specir/core/discriminator_enum_collector.hpp"
#include "specir/core/inline_promoter.hpp"
#include "specir/core/name_sanitizer.hpp"
#include "specir/core/schema_resolver.hpp"
#include "specir/core/schema_store.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <iterator>

namespace specir::openapi {

namespace {

using serde::json_value;

constexpr std::string_view kParameterPrefix = "#/components/parameters/";
constexpr std::string_view kResponsePrefix = "#/components/responses/";
constexpr std::string_view kRequestBodyPrefix = "#/components/requestBodies/";
constexpr size_t kMaxRefHops = 8;

constexpr std::array<std::string_view, 8> kMethodKeys = {
    "get", "put", "post", "delete", "options", "head", "patch", "trace"};

constexpr std::array<std::string_view, 5> kStreamingMediaTypes = {
    "application/octet-stream",
    "text/event-stream",
    "application/x-ndjson",
    "application/json-seq",
    "multipart/mixed"};

std::optional<std::string> optional_string(const json_value& node, std::string_view key) {
    if (auto v = node.string_at(key)) {
        return std::string(*v);
    }
    return std::nullopt;
}

bool is_streaming_media(std::string_view media_type) noexcept {
    for (auto streaming : kStreamingMediaTypes) {
        if (media_type == streaming) {
            return true;
        }
    }
    return false;
}

bool is_inline_object(const json_value& schema) noexcept {
    if (!schema.is_object() || schema.contains("$ref")) {
        return false;
    }
    if (schema.contains("properties") || schema.contains("additionalProperties")) {
        return true;
    }
    auto type = schema.string_at("type");
    return type && *type == "object";
}

class spec_builder {
public:
    spec_builder(const json_value& document, parse_options opts)
        : document_(document), ctx_(document, opts), resolver_(ctx_) {}

    ir_spec build();

private:
    void read_info(ir_spec& spec);
    void read_servers(ir_spec& spec);
    void build_component_schemas();
    void build_operations(ir_spec& spec);
    std::optional<ir_operation> build_operation(std::string_view path,
                                                http_method method,
                                                const json_value& op_node,
                                                const json_value* shared_params);
    std::optional<ir_parameter> build_parameter(const json_value& raw, std::string_view op_class);
    std::optional<ir_request_body> build_request_body(const json_value& raw,
                                                      std::string_view op_class);
    ir_response build_response(std::string status,
                               const json_value& raw,
                               std::string_view op_class);

    // Follows "$ref" into one of the components maps.
    const json_value* deref(const json_value& raw, std::string_view prefix);
    // Name that neither the store nor the raw components use yet.
    std::string free_schema_name(const std::string& base) const;

    const json_value& document_;
    parsing_context ctx_;
    schema_resolver resolver_;
};

const json_value* spec_builder::deref(const json_value& raw, std::string_view prefix) {
    const json_value* current = &raw;
    for (size_t hop = 0; hop < kMaxRefHops; ++hop) {
        auto ref = current->string_at("$ref");
        if (!ref) {
            return current;
        }
        if (!ref->starts_with(prefix)) {
            ctx_.warn("Unsupported or invalid $ref format: " + std::string(*ref));
            return nullptr;
        }
        std::string_view name = ref->substr(prefix.size());
        const json_value* target = nullptr;
        if (prefix == kParameterPrefix) {
            target = ctx_.raw_parameter(name);
        } else if (prefix == kResponsePrefix) {
            target = ctx_.raw_response(name);
        } else {
            target = ctx_.raw_request_body(name);
        }
        if (!target || !target->is_object()) {
            ctx_.warn("Could not resolve $ref: " + std::string(*ref));
            return nullptr;
        }
        current = target;
    }
    ctx_.warn("Too many $ref hops while resolving '" + std::string(prefix) + "' reference");
    return nullptr;
}

std::string spec_builder::free_schema_name(const std::string& base) const {
    auto taken = [this](const std::string& candidate) {
        return ctx_.store().contains(candidate) || ctx_.raw_schema(candidate) != nullptr;
    };
    if (!taken(base)) {
        return base;
    }
    for (size_t counter = 1;; ++counter) {
        std::string candidate = base + std::to_string(counter);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

void spec_builder::read_info(ir_spec& spec) {
    const json_value* info = document_.find("info");
    if (!info || !info->is_object()) {
        return;
    }
    if (auto title = info->string_at("title")) {
        spec.title = std::string(*title);
    }
    if (auto version = info->string_at("version")) {
        spec.version = std::string(*version);
    }
    spec.description = optional_string(*info, "description");
}

void spec_builder::read_servers(ir_spec& spec) {
    const json_value* servers = document_.find("servers");
    if (!servers || !servers->is_array()) {
        return;
    }
    for (const auto& server : servers->array) {
        if (server->is_object()) {
            if (auto url = server->string_at("url")) {
                spec.servers.emplace_back(*url);
            }
        }
    }
}

void spec_builder::build_component_schemas() {
    const json_value* raw = ctx_.raw_schemas();
    if (!raw) {
        return;
    }
    for (const auto& [name, node] : raw->object) {
        if (ctx_.store().contains(name)) {
            continue;
        }
        resolver_.resolve(name, node.get());
    }
}

std::optional<ir_parameter> spec_builder::build_parameter(const json_value& raw,
                                                          std::string_view op_class) {
    const json_value* param = deref(raw, kParameterPrefix);
    if (!param) {
        return std::nullopt;
    }
    auto name = param->string_at("name");
    if (!name) {
        ctx_.warn("Skipping parameter without a name in operation '" + std::string(op_class) + "'");
        return std::nullopt;
    }

    ir_parameter out;
    out.name = std::string(*name);
    if (auto in = param->string_at("in")) {
        out.in = param_location_from_string(*in).value_or(param_location::query);
    }
    out.required = out.in == param_location::path || param->bool_at("required").value_or(false);
    out.description = optional_string(*param, "description");

    const json_value* schema = param->find("schema");
    if (!schema) {
        if (const json_value* content = param->find("content");
            content && content->is_object() && !content->object.empty()) {
            schema = content->object.front().second->find("schema");
        }
    }
    out.schema = resolver_.resolve_inline(schema, op_class, out.name);
    return out;
}

std::optional<ir_request_body> spec_builder::build_request_body(const json_value& raw,
                                                                std::string_view op_class) {
    const json_value* body = deref(raw, kRequestBodyPrefix);
    if (!body) {
        return std::nullopt;
    }

    ir_request_body out;
    out.required = body->bool_at("required").value_or(false);
    out.description = optional_string(*body, "description");

    const json_value* content = body->find("content");
    if (!content || !content->is_object()) {
        return out;
    }
    for (const auto& [media_type, media] : content->object) {
        const json_value* schema = media->is_object() ? media->find("schema") : nullptr;
        ir_schema* resolved = nullptr;
        if (schema && is_inline_object(*schema)) {
            resolved = resolver_.resolve(free_schema_name(std::string(op_class) + "Request"), schema);
        } else {
            resolved = resolver_.resolve_inline(schema, op_class, "Body");
        }
        out.content.emplace_back(media_type, resolved);
    }
    return out;
}

ir_response spec_builder::build_response(std::string status,
                                         const json_value& raw,
                                         std::string_view op_class) {
    ir_response out;
    out.status_code = std::move(status);

    const json_value* resp = deref(raw, kResponsePrefix);
    if (!resp) {
        return out;
    }
    out.description = optional_string(*resp, "description");

    const json_value* content = resp->find("content");
    if (!content || !content->is_object()) {
        return out;
    }
    for (const auto& [media_type, media] : content->object) {
        const json_value* schema = media->is_object() ? media->find("schema") : nullptr;
        bool streaming = is_streaming_media(media_type);
        if (schema && schema->is_object()) {
            auto format = schema->string_at("format");
            streaming = streaming || (format && *format == "binary");
        }
        if (streaming && !out.stream) {
            out.stream = true;
            out.stream_format = media_type;
        }

        ir_schema* resolved = nullptr;
        if (schema && !streaming && is_inline_object(*schema)) {
            resolved =
                resolver_.resolve(free_schema_name(std::string(op_class) + "Response"), schema);
        } else {
            resolved = resolver_.resolve_inline(schema, op_class, "Response");
        }
        out.content.emplace_back(media_type, resolved);
    }
    return out;
}

std::optional<ir_operation> spec_builder::build_operation(std::string_view path,
                                                          http_method method,
                                                          const json_value& op_node,
                                                          const json_value* shared_params) {
    ir_operation op;
    op.method = method;
    op.path = std::string(path);
    if (auto id = op_node.string_at("operationId"); id && !id->empty()) {
        op.operation_id = std::string(*id);
    } else {
        op.operation_id =
            sanitize_method_name(std::string(http_method_name(method)) + "_" + std::string(path));
    }
    op.summary = optional_string(op_node, "summary");
    op.description = optional_string(op_node, "description");
    if (const json_value* tags = op_node.find("tags"); tags && tags->is_array()) {
        for (const auto& tag : tags->array) {
            if (tag->is_string()) {
                op.tags.push_back(tag->str);
            }
        }
    }

    const std::string op_class = sanitize_class_name(op.operation_id);

    auto add_parameters = [&](const json_value* list) {
        if (!list || !list->is_array()) {
            return;
        }
        for (const auto& raw : list->array) {
            if (!raw->is_object()) {
                continue;
            }
            auto param = build_parameter(*raw, op_class);
            if (!param) {
                continue;
            }
            // operation-level parameters override path-level ones with the same name/location
            auto same = std::find_if(op.parameters.begin(), op.parameters.end(), [&](const auto& p) {
                return p.name == param->name && p.in == param->in;
            });
            if (same != op.parameters.end()) {
                *same = std::move(*param);
            } else {
                op.parameters.push_back(std::move(*param));
            }
        }
    };
    add_parameters(shared_params);
    add_parameters(op_node.find("parameters"));

    if (const json_value* body = op_node.find("requestBody"); body && body->is_object()) {
        op.request_body = build_request_body(*body, op_class);
    }

    if (const json_value* responses = op_node.find("responses"); responses && responses->is_object()) {
        for (const auto& [status, raw] : responses->object) {
            if (raw->is_object()) {
                op.responses.push_back(build_response(status, *raw, op_class));
            }
        }
    }
    return op;
}

void spec_builder::build_operations(ir_spec& spec) {
    const json_value* paths = document_.find("paths");
    if (!paths || !paths->is_object()) {
        return;
    }
    for (const auto& [path, item] : paths->object) {
        if (!item->is_object()) {
            ctx_.warn("Skipping malformed path item '" + path + "'");
            continue;
        }
        const json_value* shared_params = item->find("parameters");
        for (auto key : kMethodKeys) {
            const json_value* op_node = item->find(key);
            if (!op_node) {
                continue;
            }
            auto method = http_method_from_string(key);
            if (!method || !op_node->is_object()) {
                ctx_.warn("Skipping malformed operation " + std::string(key) + " " + path);
                continue;
            }
            if (auto op = build_operation(path, *method, *op_node, shared_params)) {
                spec.operations.push_back(std::move(*op));
            }
        }
    }
}

ir_spec spec_builder::build() {
    ir_spec spec;
    read_info(spec);
    read_servers(spec);
    build_component_schemas();
    build_operations(spec);

    discriminator_enum_collector collector(ctx_.store());
    const schema_property_set discriminator_properties =
        collector.identify_discriminator_properties();
    extract_inline_array_items(ctx_.store());
    extract_inline_enums(ctx_.store(), discriminator_properties);
    collector.collect_unified_enums();
    for (auto& w : collector.take_warnings()) {
        ctx_.warn(std::move(w));
    }

    finalize_generation_names(ctx_.store());

    spec.discriminator_skip_list = collector.skip_list();
    spec.unified_enums = collector.unified_enums();
    spec.warnings = ctx_.take_warnings();
    spec.schemas = ctx_.release_store();
    return spec;
}

} // namespace

result<ir_spec> load_ir(const serde::json_value& document, parse_options opts) {
    if (!document.is_object()) {
        return std::unexpected(make_error_code(error_code::document_not_object));
    }
    if (!document.contains("openapi")) {
        return std::unexpected(make_error_code(error_code::missing_openapi_field));
    }
    if (!document.contains("paths")) {
        return std::unexpected(make_error_code(error_code::missing_paths_section));
    }
    spec_builder builder(document, opts);
    return builder.build();
}

result<ir_spec> load_from_string(std::string_view spec_text, parse_options opts) {
    auto document = serde::parse_document(spec_text);
    if (!document) {
        return std::unexpected(document.error());
    }
    return load_ir(*document, opts);
}

result<ir_spec> load_from_file(const char* path, parse_options opts) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error_code(error_code::file_read_error));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(make_error_code(error_code::file_read_error));
    }
    return load_from_string(content, opts);
}

} // namespace specir::openapi
