#include "trellis/graph.hpp"
#include "trellis/node.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <memory>

using namespace trellis;

class BuildGraphTest : public ::testing::Test {
protected:
    NodeRegistry registry{"/tmp/trellis_graph_root"};

    Node *file(const char *path) {
        auto node = registry.file(path);
        EXPECT_TRUE(node);
        return *node;
    }
};

TEST_F(BuildGraphTest, GetOrCreateNodeIsIdempotent) {
    BuildGraph graph;
    Node *a = file("a.c");

    size_t first = graph.get_or_create_node(a);
    size_t second = graph.get_or_create_node(a);
    EXPECT_EQ(first, second);
    EXPECT_EQ(graph.nodes().size(), 1u);
}

TEST_F(BuildGraphTest, RepeatedEdgesAreKeptOnce) {
    BuildGraph graph;
    Node *a = file("a.c");
    Node *b = file("a.o");

    graph.add_edge(a, b);
    graph.add_edge(a, b);
    EXPECT_EQ(graph.nodes()[graph.get_or_create_node(a)].out_edges.size(), 1u);
}

TEST_F(BuildGraphTest, TopoSortPutsDependenciesFirst) {
    BuildGraph graph;
    Node *src = file("main.c");
    Node *obj = file("main.o");
    Node *exe = file("app");

    BuildInvocation compile;
    compile.inputs = {src};
    compile.outputs = {obj};
    BuildInvocation link;
    link.inputs = {obj};
    link.outputs = {exe};

    graph.add_step(link, 1);
    graph.add_step(compile, 0);

    auto order = graph.topo_sort();
    ASSERT_TRUE(order) << order.error().what();

    auto pos = [&](Node *n) {
        size_t id = graph.get_or_create_node(n);
        return std::ranges::find(*order, id) - order->begin();
    };
    EXPECT_LT(pos(src), pos(obj));
    EXPECT_LT(pos(obj), pos(exe));
    EXPECT_EQ(graph.nodes()[graph.get_or_create_node(exe)].step_id.value_or(0), 1u);
    EXPECT_FALSE(graph.nodes()[graph.get_or_create_node(src)].step_id.has_value());
}

TEST_F(BuildGraphTest, CycleIsReportedWithItsChain) {
    BuildGraph graph;
    Node *a = file("a");
    Node *b = file("b");

    graph.add_edge(a, b);
    graph.add_edge(b, a);

    auto order = graph.topo_sort();
    ASSERT_FALSE(order);
    EXPECT_EQ(order.error().kind, ErrorKind::DependencyCycle);
    ASSERT_EQ(order.error().chain.size(), 3u);
    EXPECT_EQ(order.error().chain.front(), order.error().chain.back());
}
