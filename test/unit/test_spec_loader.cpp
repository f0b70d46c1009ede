#include "specir/core/schema_store.hpp"
#include "specir/core/spec_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace specir;
using namespace specir::openapi;

namespace {

const ir_operation* find_operation(const ir_spec& spec, std::string_view id) {
    for (const auto& op : spec.operations) {
        if (op.operation_id == id) {
            return &op;
        }
    }
    return nullptr;
}

bool has_warning(const ir_spec& spec, const std::string& message) {
    return std::find(spec.warnings.begin(), spec.warnings.end(), message) != spec.warnings.end();
}

const char* kPetstore = R"({
  "openapi": "3.0.3",
  "info": {"title": "Pets", "version": "2.1.0", "description": "demo"},
  "servers": [{"url": "https://api.example.com"}, {"url": "https://staging.example.com"}],
  "paths": {
    "/pets/{petId}": {
      "parameters": [
        {"name": "petId", "in": "path", "schema": {"type": "integer"}},
        {"name": "verbose", "in": "query", "schema": {"type": "boolean"}}
      ],
      "get": {
        "operationId": "getPet",
        "tags": ["pets"],
        "parameters": [
          {"$ref": "#/components/parameters/Limit"},
          {"name": "verbose", "in": "query", "required": true, "schema": {"type": "string"}},
          {"$ref": "#/components/parameters/Nope"}
        ],
        "responses": {
          "200": {"description": "ok", "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}},
          "404": {"$ref": "#/components/responses/NotFound"}
        }
      },
      "put": {
        "operationId": "updatePet",
        "requestBody": {"$ref": "#/components/requestBodies/PetBody"},
        "responses": {"204": {"description": "updated"}}
      }
    },
    "/pets": {
      "post": {
        "requestBody": {
          "required": true,
          "content": {"application/json": {"schema": {"type": "object", "properties": {"name": {"type": "string"}}}}}
        },
        "responses": {
          "201": {"description": "created", "content": {"application/json": {"schema": {"type": "object", "properties": {"id": {"type": "integer"}}}}}}
        }
      }
    }
  },
  "components": {
    "schemas": {
      "Pet": {
        "type": "object",
        "required": ["id"],
        "properties": {
          "id": {"type": "integer", "format": "int64"},
          "status": {"type": "string", "enum": ["available", "sold"]},
          "owner": {"type": "object", "properties": {"id": {"type": "integer"}, "name": {"type": "string"}}},
          "tags": {"type": "array", "items": {"type": "object", "properties": {"label": {"type": "string"}}}}
        }
      },
      "Cat": {"type": "object", "properties": {"kind": {"type": "string", "enum": ["cat"]}}},
      "Dog": {"type": "object", "properties": {"kind": {"type": "string", "enum": ["dog"]}}},
      "Animal": {
        "oneOf": [{"$ref": "#/components/schemas/Cat"}, {"$ref": "#/components/schemas/Dog"}],
        "discriminator": {"propertyName": "kind"}
      }
    },
    "parameters": {
      "Limit": {"name": "limit", "in": "query", "schema": {"type": "integer"}}
    },
    "responses": {
      "NotFound": {"description": "missing"}
    },
    "requestBodies": {
      "PetBody": {"required": true, "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}}
    }
  }
})";

} // namespace

TEST(SpecLoader, RejectsStructurallyInvalidDocuments) {
    EXPECT_EQ(load_from_string("{", parse_options{}).error(),
              make_error_code(error_code::openapi_parse_error));
    EXPECT_EQ(load_from_string("[1, 2]", parse_options{}).error(),
              make_error_code(error_code::document_not_object));
    EXPECT_EQ(load_from_string(R"({"paths": {}})", parse_options{}).error(),
              make_error_code(error_code::missing_openapi_field));
    EXPECT_EQ(load_from_string(R"({"openapi": "3.0.0"})", parse_options{}).error(),
              make_error_code(error_code::missing_paths_section));
}

TEST(SpecLoader, MissingFile) {
    auto res = load_from_file("/nonexistent/specir/openapi.json", parse_options{});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), make_error_code(error_code::file_read_error));
}

TEST(SpecLoader, InfoDefaults) {
    auto res = load_from_string(R"({"openapi": "3.0.0", "paths": {}})", parse_options{});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->title, "API Client");
    EXPECT_EQ(res->version, "0.0.0");
    EXPECT_FALSE(res->description);
    EXPECT_TRUE(res->servers.empty());
    EXPECT_TRUE(res->operations.empty());
    EXPECT_TRUE(res->schemas->empty());
}

TEST(SpecLoader, ReadsInfoAndServers) {
    auto res = load_from_string(kPetstore, parse_options{});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->title, "Pets");
    EXPECT_EQ(res->version, "2.1.0");
    EXPECT_EQ(res->description, "demo");
    ASSERT_EQ(res->servers.size(), 2U);
    EXPECT_EQ(res->servers[0], "https://api.example.com");
}

TEST(SpecLoader, OperationsFollowPathAndMethodOrder) {
    auto res = load_from_string(kPetstore, parse_options{});
    ASSERT_TRUE(res);
    ASSERT_EQ(res->operations.size(), 3U);
    EXPECT_EQ(res->operations[0].operation_id, "getPet");
    EXPECT_EQ(res->operations[0].method, http_method::get);
    EXPECT_EQ(res->operations[0].path, "/pets/{petId}");
    EXPECT_EQ(res->operations[1].operation_id, "updatePet");
    EXPECT_EQ(res->operations[1].method, http_method::put);
    EXPECT_EQ(res->operations[2].operation_id, "post_pets");
    EXPECT_EQ(res->operations[2].method, http_method::post);
}

TEST(SpecLoader, ParametersMergeSharedAndReferenced) {
    auto res = load_from_string(kPetstore, parse_options{});
    ASSERT_TRUE(res);
    const ir_operation* op = find_operation(*res, "getPet");
    ASSERT_NE(op, nullptr);
    ASSERT_EQ(op->tags.size(), 1U);
    ASSERT_EQ(op->parameters.size(), 3U);

    EXPECT_EQ(op->parameters[0].name, "petId");
    EXPECT_EQ(op->parameters[0].in, param_location::path);
    EXPECT_TRUE(op->parameters[0].required);
    EXPECT_EQ(op->parameters[0].schema->type, "integer");

    // the operation-level declaration replaced the path-level one
    EXPECT_EQ(op->parameters[1].name, "verbose");
    EXPECT_TRUE(op->parameters[1].required);
    EXPECT_EQ(op->parameters[1].schema->type, "string");

    EXPECT_EQ(op->parameters[2].name, "limit");
    EXPECT_EQ(op->parameters[2].in, param_location::query);
    EXPECT_FALSE(op->parameters[2].required);

    EXPECT_TRUE(has_warning(*res, "Could not resolve $ref: #/components/parameters/Nope"));
}

TEST(SpecLoader, ResponsesAndBodiesUseComponents) {
    auto res = load_from_string(kPetstore, parse_options{});
    ASSERT_TRUE(res);
    const ir_schema* pet = res->schema("Pet");
    ASSERT_NE(pet, nullptr);

    const ir_operation* get = find_operation(*res, "getPet");
    ASSERT_EQ(get->responses.size(), 2U);
    EXPECT_EQ(get->responses[0].status_code, "200");
    ASSERT_EQ(get->responses[0].content.size(), 1U);
    EXPECT_EQ(get->responses[0].content[0].first, "application/json");
    EXPECT_EQ(get->responses[0].content[0].second, pet);
    EXPECT_EQ(get->responses[1].status_code, "404");
    EXPECT_EQ(get->responses[1].description, "missing");

    const ir_operation* put = find_operation(*res, "updatePet");
    ASSERT_TRUE(put->request_body);
    EXPECT_TRUE(put->request_body->required);
    ASSERT_EQ(put->request_body->content.size(), 1U);
    EXPECT_EQ(put->request_body->content[0].second, pet);
}

TEST(SpecLoader, InlineBodiesAreNamedAfterTheOperation) {
    auto res = load_from_string(kPetstore, parse_options{});
    ASSERT_TRUE(res);
    const ir_operation* post = find_operation(*res, "post_pets");
    ASSERT_NE(post, nullptr);

    const ir_schema* request = res->schema("PostPetsRequest");
    ASSERT_NE(request, nullptr);
    ASSERT_TRUE(post->request_body);
    EXPECT_EQ(post->request_body->content[0].second, request);
    EXPECT_TRUE(request->has_property("name"));

    const ir_schema* response = res->schema("PostPetsResponse");
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(post->responses[0].content[0].second, response);
    EXPECT_FALSE(post->responses[0].stream);
}

TEST(SpecLoader, ComponentPassesRun) {
    auto res = load_from_string(kPetstore, parse_options{});
    ASSERT_TRUE(res);
    const ir_schema* pet = res->schema("Pet");
    ASSERT_NE(pet, nullptr);

    const ir_schema* status_enum = res->schema("PetStatusEnum");
    ASSERT_NE(status_enum, nullptr);
    EXPECT_EQ(pet->property("status")->refers_to, status_enum);

    const ir_schema* owner = res->schema("Owner");
    ASSERT_NE(owner, nullptr);
    EXPECT_EQ(pet->property("owner")->refers_to, owner);

    const ir_schema* tag_item = res->schema("PetTagsItem");
    ASSERT_NE(tag_item, nullptr);
    EXPECT_EQ(pet->property("tags")->items, tag_item);

    for (const auto& [name, s] : *res->schemas) {
        EXPECT_TRUE(s->generation_name) << name;
        EXPECT_TRUE(s->final_module_stem) << name;
    }
    EXPECT_EQ(res->warnings.size(), 1U);
}

TEST(SpecLoader, DiscriminatorEnumsAreUnified) {
    auto res = load_from_string(kPetstore, parse_options{});
    ASSERT_TRUE(res);
    EXPECT_FALSE(res->schema("CatKindEnum"));
    EXPECT_FALSE(res->schema("DogKindEnum"));

    const ir_schema* unified = res->schema("AnimalKindEnum");
    ASSERT_NE(unified, nullptr);
    ASSERT_EQ(res->unified_enums.size(), 1U);
    EXPECT_EQ(res->unified_enums[0].name, "AnimalKindEnum");
    EXPECT_EQ(res->unified_enums[0].members.size(), 2U);

    const ir_schema* cat_kind = res->schema("Cat")->property("kind");
    EXPECT_EQ(cat_kind->refers_to, unified);
    EXPECT_EQ(cat_kind->generation_name, "AnimalKindEnum");
    EXPECT_FALSE(cat_kind->enum_values);
}

TEST(SpecLoader, StreamingResponses) {
    const char* spec = R"({
      "openapi": "3.1.0",
      "paths": {
        "/events": {"get": {"operationId": "streamEvents", "responses": {"200": {"description": "sse",
          "content": {"text/event-stream": {"schema": {"type": "object", "properties": {"data": {"type": "string"}}}}}}}}},
        "/files/{id}": {"get": {"operationId": "download", "responses": {"200": {"description": "file",
          "content": {"application/pdf": {"schema": {"type": "string", "format": "binary"}}}}}}}
      }
    })";
    auto res = load_from_string(spec, parse_options{});
    ASSERT_TRUE(res);

    const ir_operation* events = find_operation(*res, "streamEvents");
    ASSERT_NE(events, nullptr);
    EXPECT_TRUE(events->responses[0].stream);
    EXPECT_EQ(events->responses[0].stream_format, "text/event-stream");
    EXPECT_FALSE(res->schema("StreamEventsResponse"));

    const ir_operation* download = find_operation(*res, "download");
    EXPECT_TRUE(download->responses[0].stream);
    EXPECT_EQ(download->responses[0].stream_format, "application/pdf");
}

TEST(SpecLoader, CyclicComponentsLoad) {
    const char* spec = R"({
      "openapi": "3.0.0",
      "paths": {},
      "components": {"schemas": {
        "Node": {"type": "object", "properties": {
          "children": {"type": "array", "items": {"$ref": "#/components/schemas/Node"}},
          "parent": {"$ref": "#/components/schemas/Node"}
        }}
      }}
    })";
    auto res = load_from_string(spec, parse_options{});
    ASSERT_TRUE(res);
    const ir_schema* node = res->schema("Node");
    ASSERT_NE(node, nullptr);
    EXPECT_TRUE(node->is_circular_ref);
    EXPECT_EQ(node->property("parent"), node);
    EXPECT_EQ(node->property("children")->items, node);
    EXPECT_EQ(res->schemas->size(), 1U);
}

TEST(SpecLoader, YamlDocument) {
    const char* yaml = R"(openapi: 3.0.0
info:
  title: Yaml API
paths:
  /ping:
    get:
      operationId: ping
      responses:
        '200':
          description: pong
components:
  schemas:
    Pong:
      type: object
      properties:
        ok:
          type: boolean
)";
    auto res = load_from_string(yaml, parse_options{});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->title, "Yaml API");
    ASSERT_EQ(res->operations.size(), 1U);
    EXPECT_EQ(res->operations[0].operation_id, "ping");
    EXPECT_EQ(res->operations[0].responses[0].status_code, "200");
    ASSERT_NE(res->schema("Pong"), nullptr);
    EXPECT_EQ(res->schema("Pong")->property("ok")->type, "boolean");
}

TEST(SpecLoader, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "specir_loader_test.json";
    {
        std::ofstream out(path, std::ios::binary);
        out << kPetstore;
    }
    auto res = load_from_file(path.c_str(), parse_options{});
    std::filesystem::remove(path);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->title, "Pets");
}

TEST(SpecLoader, DepthLimitFromOptions) {
    const char* spec = R"({
      "openapi": "3.0.0",
      "paths": {},
      "components": {"schemas": {
        "A": {"type": "object", "properties": {"b": {"$ref": "#/components/schemas/B"}}},
        "B": {"type": "object", "properties": {"c": {"$ref": "#/components/schemas/C"}}},
        "C": {"type": "string"}
      }}
    })";
    parse_options opts;
    opts.max_depth = 2;
    auto res = load_from_string(spec, opts);
    ASSERT_TRUE(res);
    EXPECT_TRUE(has_warning(*res, "Maximum recursion depth (2) exceeded while parsing schema 'B'"));
    EXPECT_EQ(res->schema("A")->property("b")->placeholder, placeholder_kind::max_depth);
}
