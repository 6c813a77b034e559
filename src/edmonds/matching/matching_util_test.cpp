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

#include <map>
#include <string>

#include "edmonds/matching/matching_util.h"
#include "edmonds/unittest/unittest.h"

namespace edmonds {
namespace {

Graph path() {
    Graph g;
    g.addWeightedEdges({{1, 2, 5}, {2, 3, 11}, {3, 4, 5}});
    return g;
}

TEST(MatchingUtilTest, IsMatching) {
    const Graph g = path();
    ASSERT(isMatching(g, Matching<int>{}));
    ASSERT(isMatching(g, Matching<int>{{2, 3}}));
    ASSERT(isMatching(g, Matching<int>{{1, 2}, {3, 4}}));
    // Not an edge.
    ASSERT_FALSE(isMatching(g, Matching<int>{{1, 3}}));
    // Node 2 appears twice.
    ASSERT_FALSE(isMatching(g, Matching<int>{{1, 2}, {2, 3}}));
}

TEST(MatchingUtilTest, IsMatchingRejectsSelfLoops) {
    Graph g = path();
    g.addEdge(4, 4);
    ASSERT_FALSE(isMatching(g, Matching<int>{{4, 4}}));
}

TEST(MatchingUtilTest, IsMatchingUnknownNode) {
    ASSERT_THROWS_CODE(
        isMatching(path(), Matching<int>{{1, 99}}), AssertionException, ErrorCodes::NoSuchKey);
}

TEST(MatchingUtilTest, IsMaximalMatching) {
    const Graph g = path();
    ASSERT(isMaximalMatching(g, Matching<int>{{2, 3}}));
    ASSERT(isMaximalMatching(g, Matching<int>{{1, 2}, {3, 4}}));
    ASSERT_FALSE(isMaximalMatching(g, Matching<int>{{1, 2}}));
    ASSERT_FALSE(isMaximalMatching(g, Matching<int>{}));
    ASSERT_FALSE(isMaximalMatching(g, Matching<int>{{1, 3}}));
}

TEST(MatchingUtilTest, IsPerfectMatching) {
    Graph g = path();
    ASSERT(isPerfectMatching(g, Matching<int>{{1, 2}, {3, 4}}));
    ASSERT_FALSE(isPerfectMatching(g, Matching<int>{{2, 3}}));
    g.addNode(5);
    ASSERT_FALSE(isPerfectMatching(g, Matching<int>{{1, 2}, {3, 4}}));
}

TEST(MatchingUtilTest, MaximalMatchingStar) {
    Graph g;
    for (int leaf = 1; leaf <= 5; ++leaf)
        g.addEdge(0, leaf);
    g.addEdge(1, 2);
    const auto matching = maximalMatching(g);
    ASSERT_EQUALS(matching, (Matching<int>{{0, 1}}));
    ASSERT(isMaximalMatching(g, matching));
}

TEST(MatchingUtilTest, MaximalMatchingCoversEveryEdge) {
    Graph g;
    g.addEdge(1, 2);
    g.addEdge(1, 5);
    g.addEdge(2, 3);
    g.addEdge(2, 5);
    g.addEdge(3, 4);
    g.addEdge(3, 6);
    g.addEdge(5, 6);
    g.addEdge(6, 6);
    const auto matching = maximalMatching(g);
    ASSERT(isMaximalMatching(g, matching));
    ASSERT_EQUALS(matching, (Matching<int>{{1, 2}, {3, 4}, {5, 6}}));
}

TEST(MatchingUtilTest, MaximalMatchingIgnoresNodeOrder) {
    for (const auto& order : {std::vector<int>{100, 200, 300},
                              std::vector<int>{200, 100, 300},
                              std::vector<int>{300, 200, 100}}) {
        Graph g;
        for (int node : order)
            g.addNode(node);
        g.addEdge(100, 200);
        g.addEdge(100, 300);
        ASSERT_EQUALS(maximalMatching(g).size(), 1U);
    }
}

TEST(MatchingUtilTest, MatchingWeight) {
    Graph g = path();
    g.addEdge(4, 5);
    ASSERT_EQUALS(matchingWeight(g, Matching<int>{}), 0.0);
    ASSERT_EQUALS(matchingWeight(g, Matching<int>{{1, 2}, {3, 4}}), 10.0);
    ASSERT_EQUALS(matchingWeight(g, Matching<int>{{2, 3}, {4, 5}}), 12.0);
    ASSERT_EQUALS(matchingWeight(g, Matching<int>{{2, 3}}, "cost"), 1.0);
    ASSERT_THROWS_CODE(
        matchingWeight(g, Matching<int>{{1, 4}}), AssertionException, ErrorCodes::NoSuchKey);
}

TEST(MatchingUtilTest, MateMapToMatching) {
    const std::map<std::string, std::string> mate{
        {"a", "b"}, {"b", "a"}, {"d", "c"}, {"e", "f"}};
    ASSERT_EQUALS(mateMapToMatching(mate),
                  (Matching<std::string>{{"a", "b"}, {"c", "d"}, {"e", "f"}}));
    ASSERT(mateMapToMatching(std::map<int, int>{}).empty());
}

TEST(MatchingUtilTest, MateMapRejectsSelfMatch) {
    ASSERT_THROWS_CODE(mateMapToMatching(std::map<int, int>{{3, 3}}),
                       AssertionException,
                       ErrorCodes::BadValue);
}

}  // namespace
}  // namespace edmonds
