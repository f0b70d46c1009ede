#include "specir/core/module_graph.hpp"
#include "specir/core/schema_store.hpp"

#include <gtest/gtest.h>

using namespace specir::openapi;

namespace {

ir_schema* named(schema_store& store, const char* name, const char* stem) {
    ir_schema* s = store.insert_or_get(name);
    s->type = "object";
    s->assign_generation_name(name, stem);
    return s;
}

} // namespace

TEST(ModuleGraph, EdgesWalkThroughAnonymousNodes) {
    schema_store store;
    ir_schema* order = named(store, "Order", "order");
    ir_schema* line = named(store, "Line", "line");
    ir_schema* product = named(store, "Product", "product");

    ir_schema* lines = store.make();
    lines->type = "array";
    lines->items = line;
    order->properties.emplace_back("lines", lines);

    ir_schema* wrapper = store.make();
    wrapper->any_of = std::vector<ir_schema*>{product};
    line->properties.emplace_back("product", wrapper);

    module_graph graph = module_graph::build(store);
    const auto& edges = graph.edges();
    ASSERT_TRUE(edges.contains("order"));
    EXPECT_TRUE(edges.at("order").contains("line"));
    // named nodes end a walk
    EXPECT_FALSE(edges.at("order").contains("product"));
    EXPECT_TRUE(edges.at("line").contains("product"));
    EXPECT_EQ(graph.module_count(), 3U);

    EXPECT_TRUE(graph.reaches("order", "product"));
    EXPECT_FALSE(graph.reaches("product", "order"));
    EXPECT_TRUE(graph.reaches("order", "order"));
    EXPECT_FALSE(graph.in_cycle("order", "line"));
}

TEST(ModuleGraph, SlotsAndAdditionalPropertiesCreateEdges) {
    schema_store store;
    ir_schema* pet = named(store, "Pet", "pet");
    ir_schema* status = named(store, "PetStatusEnum", "pet_status_enum");
    ir_schema* tag = named(store, "Tag", "tag");

    ir_schema* slot = store.make();
    slot->name = "status";
    slot->refers_to = status;
    pet->properties.emplace_back("status", slot);

    ir_schema* labels = store.make();
    labels->type = "object";
    labels->additional_properties = tag;
    pet->properties.emplace_back("labels", labels);

    module_graph graph = module_graph::build(store);
    EXPECT_TRUE(graph.edges().at("pet").contains("pet_status_enum"));
    EXPECT_TRUE(graph.edges().at("pet").contains("tag"));
}

TEST(ModuleGraph, CyclesAndSkippedSchemas) {
    schema_store store;
    ir_schema* a = named(store, "A", "a");
    ir_schema* b = named(store, "B", "b");
    ir_schema* old = named(store, "OldEnum", "old_enum");
    a->properties.emplace_back("b", b);
    b->properties.emplace_back("a", a);
    old->properties.emplace_back("a", a);

    module_graph graph = module_graph::build(store, {"OldEnum"});
    EXPECT_TRUE(graph.in_cycle("a", "b"));
    EXPECT_FALSE(graph.edges().contains("old_enum"));
    EXPECT_EQ(graph.module_count(), 2U);
}

TEST(ModuleGraph, SelfEdgesAreDropped) {
    schema_store store;
    ir_schema* node = named(store, "Node", "node");
    node->properties.emplace_back("parent", node);
    module_graph graph = module_graph::build(store);
    EXPECT_TRUE(graph.edges().at("node").empty());
}

TEST(ImportCollector, ResolvesSelfAndOtherModules) {
    schema_store store;
    ir_schema* a = named(store, "A", "a");
    ir_schema* b = named(store, "B", "b");
    ir_schema* c = named(store, "C", "c");
    a->properties.emplace_back("b", b);
    b->properties.emplace_back("a", a);
    a->properties.emplace_back("c", c);

    module_graph graph = module_graph::build(store);
    import_collector ctx(graph, "a");
    EXPECT_EQ(ctx.current_module(), "a");

    auto self = ctx.resolve_relative_or_forward("a");
    EXPECT_EQ(self.path, "");
    EXPECT_TRUE(self.is_forward_ref);

    auto cyclic = ctx.resolve_relative_or_forward("b");
    EXPECT_EQ(cyclic.path, ".b");
    EXPECT_TRUE(cyclic.is_forward_ref);

    auto plain = ctx.resolve_relative_or_forward("c");
    EXPECT_EQ(plain.path, ".c");
    EXPECT_FALSE(plain.is_forward_ref);
}

TEST(ImportCollector, StatementsAreGroupedAndOrdered) {
    module_graph graph;
    import_collector ctx(graph, "pet");
    ctx.add_typing_import("Optional");
    ctx.add_typing_import("List");
    ctx.add_import(".tag", "Tag");
    ctx.add_import(".tag", "Tag");
    ctx.add_import("datetime", "datetime");
    ctx.add_import("", "Ignored");

    auto lines = ctx.statements();
    ASSERT_EQ(lines.size(), 3U);
    EXPECT_EQ(lines[0], "from .tag import Tag");
    EXPECT_EQ(lines[1], "from datetime import datetime");
    EXPECT_EQ(lines[2], "from typing import List, Optional");
    EXPECT_TRUE(ctx.has_import("typing", "List"));

    ctx.clear();
    EXPECT_TRUE(ctx.statements().empty());
}
