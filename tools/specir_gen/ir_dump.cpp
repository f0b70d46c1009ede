#include "generator.hpp"

#include "specir/core/schema_store.hpp"
#include "specir/core/serde.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace specir_gen {

using specir::openapi::enum_value;
using specir::openapi::ir_schema;
using specir::serde::escape_json_string;

namespace {

std::string_view placeholder_name(specir::openapi::placeholder_kind k) {
    using specir::openapi::placeholder_kind;
    switch (k) {
    case placeholder_kind::none:
        return "none";
    case placeholder_kind::cycle:
        return "cycle";
    case placeholder_kind::unresolved_ref:
        return "unresolved_ref";
    case placeholder_kind::max_depth:
        return "max_depth";
    }
    return "none";
}

void write_optional(std::ostream& os, const std::optional<std::string>& v) {
    if (v) {
        os << "\"" << escape_json_string(*v) << "\"";
    } else {
        os << "null";
    }
}

void write_enum_value(std::ostream& os, const enum_value& v) {
    if (const auto* s = std::get_if<std::string>(&v)) {
        os << "\"" << escape_json_string(*s) << "\"";
    } else {
        os << specir::openapi::enum_value_to_string(v);
    }
}

// Type label for a schema reference: its registered name when it has one.
std::string reference_label(const ir_schema* s) {
    if (!s) {
        return "null";
    }
    if (s->refers_to && s->refers_to->name) {
        return "\"" + escape_json_string(*s->refers_to->name) + "\"";
    }
    if (s->name && s->generation_name) {
        return "\"" + escape_json_string(*s->name) + "\"";
    }
    return "\"" + escape_json_string(s->type.value_or("any")) + "\"";
}

void write_schema(std::ostream& os, const std::string& name, const ir_schema& s) {
    os << "{";
    os << "\"name\":\"" << escape_json_string(name) << "\",";
    os << "\"generationName\":";
    write_optional(os, s.generation_name);
    os << ",\"module\":";
    write_optional(os, s.final_module_stem);
    os << ",\"type\":";
    write_optional(os, s.type);
    os << ",\"format\":";
    write_optional(os, s.format);
    os << ",\"nullable\":" << (s.is_nullable ? "true" : "false");
    os << ",\"dataWrapper\":" << (s.is_data_wrapper ? "true" : "false");
    os << ",\"circular\":" << (s.is_circular_ref ? "true" : "false");
    if (s.is_circular_ref) {
        os << ",\"cyclePath\":\"" << escape_json_string(s.circular_ref_path) << "\"";
    }
    os << ",\"placeholder\":\"" << placeholder_name(s.placeholder) << "\"";

    os << ",\"properties\":[";
    bool first = true;
    for (const auto& [key, prop] : s.properties) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << "{\"name\":\"" << escape_json_string(key) << "\",\"type\":" << reference_label(prop)
           << ",\"required\":" << (s.is_required(key) ? "true" : "false") << "}";
    }
    os << "]";

    if (s.items) {
        os << ",\"items\":" << reference_label(s.items);
    }
    if (s.enum_values) {
        os << ",\"enum\":[";
        for (size_t i = 0; i < s.enum_values->size(); ++i) {
            if (i > 0) {
                os << ",";
            }
            write_enum_value(os, (*s.enum_values)[i]);
        }
        os << "]";
    }
    auto write_members = [&](std::string_view key, const auto& members) {
        if (!members) {
            return;
        }
        os << ",\"" << key << "\":[";
        for (size_t i = 0; i < members->size(); ++i) {
            if (i > 0) {
                os << ",";
            }
            os << reference_label((*members)[i]);
        }
        os << "]";
    };
    write_members("anyOf", s.any_of);
    write_members("allOf", s.all_of);
    write_members("oneOf", s.one_of);
    if (s.discriminator) {
        os << ",\"discriminator\":\"" << escape_json_string(s.discriminator->property_name)
           << "\"";
    }
    os << "}";
}

} // namespace

std::string dump_ir_summary(const ir_spec& spec) {
    std::ostringstream os;
    os << "{";
    os << "\"title\":\"" << escape_json_string(spec.title) << "\",";
    os << "\"version\":\"" << escape_json_string(spec.version) << "\",";
    os << "\"description\":";
    write_optional(os, spec.description);
    os << ",\"servers\":[";
    for (size_t i = 0; i < spec.servers.size(); ++i) {
        if (i > 0) {
            os << ",";
        }
        os << "\"" << escape_json_string(spec.servers[i]) << "\"";
    }
    os << "]";

    os << ",\"schemas\":[";
    bool first_schema = true;
    for (const auto& [name, s] : *spec.schemas) {
        if (!first_schema) {
            os << ",";
        }
        first_schema = false;
        write_schema(os, name, *s);
    }
    os << "]";

    os << ",\"operations\":[";
    bool first_op = true;
    for (const auto& op : spec.operations) {
        if (!first_op) {
            os << ",";
        }
        first_op = false;
        os << "{";
        os << "\"method\":\"" << specir::openapi::http_method_name(op.method) << "\",";
        os << "\"path\":\"" << escape_json_string(op.path) << "\",";
        os << "\"operationId\":\"" << escape_json_string(op.operation_id) << "\",";
        os << "\"parameters\":[";
        bool first_param = true;
        for (const auto& param : op.parameters) {
            if (!first_param) {
                os << ",";
            }
            first_param = false;
            os << "{\"name\":\"" << escape_json_string(param.name) << "\",\"in\":\""
               << specir::openapi::param_location_name(param.in)
               << "\",\"required\":" << (param.required ? "true" : "false")
               << ",\"schema\":" << reference_label(param.schema) << "}";
        }
        os << "],";

        os << "\"requestBody\":";
        if (op.request_body) {
            os << "{\"required\":" << (op.request_body->required ? "true" : "false")
               << ",\"content\":[";
            bool first_media = true;
            for (const auto& [media, schema] : op.request_body->content) {
                if (!first_media) {
                    os << ",";
                }
                first_media = false;
                os << "{\"contentType\":\"" << escape_json_string(media)
                   << "\",\"schema\":" << reference_label(schema) << "}";
            }
            os << "]}";
        } else {
            os << "null";
        }
        os << ",";

        os << "\"responses\":[";
        bool first_resp = true;
        for (const auto& resp : op.responses) {
            if (!first_resp) {
                os << ",";
            }
            first_resp = false;
            os << "{\"status\":\"" << escape_json_string(resp.status_code) << "\",";
            os << "\"stream\":" << (resp.stream ? "true" : "false") << ",";
            os << "\"content\":[";
            bool first_c = true;
            for (const auto& [media, schema] : resp.content) {
                if (!first_c) {
                    os << ",";
                }
                first_c = false;
                os << "{\"contentType\":\"" << escape_json_string(media)
                   << "\",\"schema\":" << reference_label(schema) << "}";
            }
            os << "]}";
        }
        os << "]";
        os << "}";
    }
    os << "]";

    os << ",\"unifiedEnums\":[";
    bool first_enum = true;
    for (const auto& u : spec.unified_enums) {
        if (!first_enum) {
            os << ",";
        }
        first_enum = false;
        os << "{\"name\":\"" << escape_json_string(u.name) << "\",\"union\":\""
           << escape_json_string(u.union_name) << "\",\"property\":\""
           << escape_json_string(u.property_name) << "\",\"members\":[";
        for (size_t i = 0; i < u.members.size(); ++i) {
            if (i > 0) {
                os << ",";
            }
            os << "{\"name\":\"" << escape_json_string(u.members[i].first) << "\",\"value\":";
            write_enum_value(os, u.members[i].second);
            os << "}";
        }
        os << "]}";
    }
    os << "]";

    os << ",\"skipped\":[";
    bool first_skip = true;
    for (const auto& name : spec.discriminator_skip_list) {
        if (!first_skip) {
            os << ",";
        }
        first_skip = false;
        os << "\"" << escape_json_string(name) << "\"";
    }
    os << "]";
    os << ",\"warnings\":" << spec.warnings.size();
    os << "}";
    return os.str();
}

} // namespace specir_gen
