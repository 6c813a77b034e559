/**
 *    Copyright (C) 2024-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#include <string>
#include <vector>

#include "edmonds/graph/graph.h"
#include "edmonds/unittest/unittest.h"

namespace edmonds {
namespace {

TEST(GraphTest, EmptyGraph) {
    Graph g;
    ASSERT_EQUALS(g.numberOfNodes(), 0U);
    ASSERT_EQUALS(g.numberOfEdges(), 0U);
    ASSERT_FALSE(g.isDirected());
    ASSERT_FALSE(g.isMultigraph());
    ASSERT_FALSE(g.hasNode(1));
}

TEST(GraphTest, AddEdgeAddsNodesInOrder) {
    Graph g;
    g.addNode(30);
    g.addEdge(10, 20);
    g.addEdge(20, 30);
    ASSERT_EQUALS(g.nodes(), (std::vector<int>{30, 10, 20}));
    ASSERT_EQUALS(g.numberOfEdges(), 2U);
    ASSERT(g.hasEdge(20, 10));
    ASSERT_FALSE(g.hasEdge(10, 30));
}

TEST(GraphTest, WeightDefaultsToOne) {
    Graph g;
    g.addEdge(1, 2);
    g.addWeightedEdge(2, 3, 7.5);
    ASSERT_EQUALS(unittest::assertGet(g.edgeWeight(1, 2)), 1.0);
    ASSERT_EQUALS(unittest::assertGet(g.edgeWeight(3, 2)), 7.5);
    ASSERT_EQUALS(unittest::assertGet(g.edgeWeight(2, 3, "cost")), 1.0);
    ASSERT_EQUALS(g.edgeWeight(1, 3).getStatus(), ErrorCodes::NoSuchKey);
}

TEST(GraphTest, ReaddingEdgeMergesAttributes) {
    Graph g;
    g.addEdge(4, 5, {{"weight", 4}, {"capacity", 2}});
    g.addWeightedEdge(5, 4, 3);
    ASSERT_EQUALS(g.numberOfEdges(), 1U);
    auto data = unittest::assertGet(g.edgeData(4, 5));
    ASSERT_EQUALS(data["weight"], 3.0);
    ASSERT_EQUALS(data["capacity"], 2.0);
}

TEST(GraphTest, RemoveEdge) {
    Graph g;
    g.addWeightedEdges({{1, 6, 4}, {1, 2, 9}, {3, 6, 4}});
    ASSERT_OK(g.removeEdge(6, 1));
    ASSERT_FALSE(g.hasEdge(1, 6));
    ASSERT(g.hasNode(6));
    ASSERT_EQUALS(g.numberOfEdges(), 2U);
    ASSERT_EQUALS(unittest::assertGet(g.neighbors(6)), (std::vector<int>{3}));
    ASSERT_EQUALS(g.removeEdge(1, 6), ErrorCodes::NoSuchKey);
    ASSERT_EQUALS(g.removeEdge(1, 99), ErrorCodes::NoSuchKey);
}

TEST(GraphTest, NeighborsInEdgeOrder) {
    Graph g;
    g.addEdge(1, 5);
    g.addEdge(3, 1);
    g.addEdge(1, 2);
    g.addEdge(1, 1);
    ASSERT_EQUALS(unittest::assertGet(g.neighbors(1)), (std::vector<int>{5, 3, 2, 1}));
    ASSERT_EQUALS(g.neighbors(42).getStatus(), ErrorCodes::NoSuchKey);
}

TEST(GraphTest, SelfLoops) {
    Graph g;
    g.addWeightedEdge(0, 0, 100);
    g.addEdge(0, 1);
    ASSERT_EQUALS(g.numberOfSelfLoops(), 1U);
    ASSERT_EQUALS(g.numberOfNodes(), 2U);
}

TEST(GraphTest, DirectedEdgesAreOrdered) {
    Graph g(GraphKind::kDiGraph);
    g.addEdge(1, 2);
    ASSERT(g.isDirected());
    ASSERT(g.hasEdge(1, 2));
    ASSERT_FALSE(g.hasEdge(2, 1));
    ASSERT_EQUALS(unittest::assertGet(g.neighbors(2)), (std::vector<int>{}));
}

TEST(GraphTest, MultigraphKeepsParallelEdges) {
    BasicGraph<std::string> g(GraphKind::kMultiGraph);
    g.addWeightedEdge("a", "b", 1);
    g.addWeightedEdge("b", "a", 2);
    ASSERT(g.isMultigraph());
    ASSERT_EQUALS(g.numberOfEdges(), 2U);
    ASSERT_EQUALS(unittest::assertGet(g.neighbors("a")), (std::vector<std::string>{"b"}));

    ASSERT_OK(g.removeEdge("a", "b"));
    ASSERT_EQUALS(g.numberOfEdges(), 1U);
    ASSERT_EQUALS(unittest::assertGet(g.edgeWeight("a", "b")), 1.0);
}

TEST(GraphTest, KindNames) {
    ASSERT_EQUALS(toString(GraphKind::kGraph), "Graph");
    ASSERT_EQUALS(toString(GraphKind::kMultiDiGraph), "MultiDiGraph");
    ASSERT(isDirected(GraphKind::kMultiDiGraph));
    ASSERT_FALSE(isMultigraph(GraphKind::kDiGraph));
}

}  // namespace
}  // namespace edmonds
