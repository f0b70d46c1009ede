#include "specir/core/parsing_context.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <optional>
#include <string>

using namespace specir;
using namespace specir::openapi;

namespace {

serde::json_value make_document() {
    auto doc = serde::parse_json(R"({
      "openapi": "3.0.0",
      "paths": {},
      "components": {
        "schemas": {"Pet": {"type": "object"}},
        "parameters": {"Limit": {"name": "limit", "in": "query"}},
        "responses": {"NotFound": {"description": "missing"}},
        "requestBodies": {"PetBody": {"required": true}}
      }
    })");
    return std::move(*doc);
}

class env_guard {
public:
    env_guard(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        ::setenv(name, value, 1);
    }
    ~env_guard() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

} // namespace

TEST(ParseOptions, Defaults) {
    parse_options opts;
    EXPECT_EQ(opts.max_depth, kDefaultMaxDepth);
    EXPECT_EQ(opts.max_depth, 100U);
    EXPECT_FALSE(opts.debug_cycles);
    EXPECT_EQ(opts.max_cycles, 0U);
}

TEST(ParseOptions, ReadsEnvironment) {
    env_guard depth("SPECIR_MAX_DEPTH", "12");
    env_guard debug("SPECIR_DEBUG_CYCLES", "true");
    env_guard cycles("SPECIR_MAX_CYCLES", "3");
    auto opts = parse_options::from_env();
    EXPECT_EQ(opts.max_depth, 12U);
    EXPECT_TRUE(opts.debug_cycles);
    EXPECT_EQ(opts.max_cycles, 3U);
}

TEST(ParseOptions, MalformedDepthFallsBack) {
    env_guard depth("SPECIR_MAX_DEPTH", "deep");
    env_guard debug("SPECIR_DEBUG_CYCLES", "0");
    auto opts = parse_options::from_env();
    EXPECT_EQ(opts.max_depth, kDefaultMaxDepth);
    EXPECT_FALSE(opts.debug_cycles);
}

TEST(ParsingContext, EnterAndExitTrackPathAndDepth) {
    parsing_context ctx(parse_options{});
    EXPECT_TRUE(std::holds_alternative<guard_proceed>(ctx.enter_schema("A")));
    EXPECT_TRUE(std::holds_alternative<guard_proceed>(ctx.enter_schema(std::nullopt)));
    EXPECT_TRUE(std::holds_alternative<guard_proceed>(ctx.enter_schema("B")));
    EXPECT_EQ(ctx.depth(), 3U);
    ASSERT_EQ(ctx.parsing_path().size(), 2U);
    EXPECT_TRUE(ctx.is_parsing("A"));
    EXPECT_TRUE(ctx.is_parsing("B"));

    ctx.exit_schema("B");
    ctx.exit_schema(std::nullopt);
    ctx.exit_schema("A");
    EXPECT_EQ(ctx.depth(), 0U);
    EXPECT_TRUE(ctx.parsing_path().empty());
    EXPECT_EQ(ctx.max_depth_reached(), 3U);
}

TEST(ParsingContext, ReenteringANameIsACycle) {
    parsing_context ctx(parse_options{});
    ASSERT_TRUE(std::holds_alternative<guard_proceed>(ctx.enter_schema("A")));
    ASSERT_TRUE(std::holds_alternative<guard_proceed>(ctx.enter_schema("B")));
    auto verdict = ctx.enter_schema("A");
    const auto* hit = std::get_if<cycle_hit>(&verdict);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->path, "A -> B -> A");
    EXPECT_TRUE(ctx.cycle_detected());
    EXPECT_EQ(ctx.cycle_count(), 1U);
    // the cycle entry is not pushed a second time
    EXPECT_EQ(ctx.parsing_path().size(), 2U);
}

TEST(ParsingContext, DepthLimitIsStrict) {
    parse_options opts;
    opts.max_depth = 2;
    parsing_context ctx(opts);
    EXPECT_TRUE(std::holds_alternative<guard_proceed>(ctx.enter_schema("A")));
    EXPECT_TRUE(std::holds_alternative<guard_proceed>(ctx.enter_schema("B")));
    auto verdict = ctx.enter_schema("C");
    const auto* deep = std::get_if<depth_exceeded>(&verdict);
    ASSERT_NE(deep, nullptr);
    EXPECT_EQ(deep->depth, 3U);
    EXPECT_EQ(deep->limit, 2U);
    EXPECT_FALSE(ctx.is_parsing("C"));
}

TEST(ParsingContext, ExitRemovesMostRecentOccurrence) {
    parsing_context ctx(parse_options{});
    ctx.enter_schema("A");
    ctx.enter_schema("B");
    ctx.exit_schema("A");
    ASSERT_EQ(ctx.parsing_path().size(), 1U);
    EXPECT_EQ(ctx.parsing_path().front(), "B");
}

TEST(ParsingContext, ScopeBalancesEveryVerdict) {
    parse_options opts;
    opts.max_depth = 1;
    parsing_context ctx(opts);
    {
        schema_scope outer(ctx, "A");
        EXPECT_TRUE(std::holds_alternative<guard_proceed>(outer.verdict()));
        {
            schema_scope inner(ctx, "B");
            EXPECT_TRUE(std::holds_alternative<depth_exceeded>(inner.verdict()));
        }
        EXPECT_EQ(ctx.depth(), 1U);
        EXPECT_TRUE(ctx.is_parsing("A"));
    }
    EXPECT_EQ(ctx.depth(), 0U);
    EXPECT_TRUE(ctx.parsing_path().empty());
}

TEST(ParsingContext, CycleScopeDoesNotPopTheOuterEntry) {
    parsing_context ctx(parse_options{});
    schema_scope outer(ctx, "Node");
    {
        schema_scope again(ctx, "Node");
        EXPECT_TRUE(std::holds_alternative<cycle_hit>(again.verdict()));
    }
    EXPECT_TRUE(ctx.is_parsing("Node"));
}

TEST(ParsingContext, RawComponentLookups) {
    auto doc = make_document();
    parsing_context ctx(doc, parse_options{});
    ASSERT_NE(ctx.raw_schemas(), nullptr);
    EXPECT_NE(ctx.raw_schema("Pet"), nullptr);
    EXPECT_EQ(ctx.raw_schema("Missing"), nullptr);
    EXPECT_NE(ctx.raw_parameter("Limit"), nullptr);
    EXPECT_NE(ctx.raw_response("NotFound"), nullptr);
    EXPECT_NE(ctx.raw_request_body("PetBody"), nullptr);
}

TEST(ParsingContext, DocumentWithoutComponents) {
    auto doc = serde::parse_json(R"({"openapi": "3.0.0", "paths": {}})");
    ASSERT_TRUE(doc);
    parsing_context ctx(*doc, parse_options{});
    EXPECT_EQ(ctx.raw_schemas(), nullptr);
    EXPECT_EQ(ctx.raw_schema("Pet"), nullptr);
}

TEST(ParsingContext, WarningsAreCollectedAndTaken) {
    parsing_context ctx(parse_options{});
    ctx.warn("first");
    ctx.warn("second");
    ASSERT_EQ(ctx.warnings().size(), 2U);
    auto taken = ctx.take_warnings();
    EXPECT_EQ(taken.size(), 2U);
    EXPECT_EQ(taken[0], "first");
    EXPECT_TRUE(ctx.warnings().empty());
}

TEST(ParsingContext, ResetClearsRunState) {
    parsing_context ctx(parse_options{});
    ctx.enter_schema("A");
    ctx.enter_schema("A");
    ctx.warn("w");
    ctx.store().insert_or_get("A");
    ctx.reset();
    EXPECT_EQ(ctx.depth(), 0U);
    EXPECT_TRUE(ctx.parsing_path().empty());
    EXPECT_FALSE(ctx.cycle_detected());
    EXPECT_EQ(ctx.cycle_count(), 0U);
    EXPECT_TRUE(ctx.warnings().empty());
    EXPECT_TRUE(ctx.store().empty());
}

TEST(ParsingContext, ReleaseStoreHandsOverSchemas) {
    parsing_context ctx(parse_options{});
    ir_schema* pet = ctx.store().insert_or_get("Pet");
    auto store = ctx.release_store();
    ASSERT_TRUE(store);
    EXPECT_EQ(store->find("Pet"), pet);
    EXPECT_TRUE(ctx.store().empty());
}

TEST(SchemaStore, InsertOrGetReturnsCanonicalSlot) {
    schema_store store;
    ir_schema* a = store.insert_or_get("A");
    EXPECT_EQ(store.insert_or_get("A"), a);
    EXPECT_EQ(a->name, "A");
    EXPECT_EQ(store.size(), 1U);

    ir_schema* other = store.make();
    EXPECT_FALSE(store.insert("A", other));
    EXPECT_TRUE(store.insert("A", a));
    EXPECT_TRUE(store.erase("A"));
    EXPECT_FALSE(store.contains("A"));
    // storage outlives the index entry
    EXPECT_EQ(store.allocated(), 2U);
    EXPECT_EQ(a->name, "A");
}
