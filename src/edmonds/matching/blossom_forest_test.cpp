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

#include <vector>

#include "edmonds/matching/blossom_forest.h"
#include "edmonds/unittest/unittest.h"

namespace edmonds {
namespace {

// Contracts the triangle 0-1-2 with base 0 into a fresh blossom.
BlossomId contractTriangle(BlossomForest& forest) {
    const BlossomId b = forest.allocate();
    forest.setBase(b, 0);
    forest.children(b) = {0, 1, 2};
    forest.edges(b) = {{0, 1, 0}, {1, 2, 1}, {2, 0, 2}};
    for (VertexId v : {0, 1, 2}) {
        forest.setParent(v, b);
        forest.setTopLevel(v, b);
    }
    return b;
}

TEST(BlossomForestTest, StartsWithTrivialBlossoms) {
    BlossomForest forest(4);
    ASSERT_EQUALS(forest.numVertices(), 4);
    for (VertexId v = 0; v < 4; ++v) {
        ASSERT(forest.isVertex(v));
        ASSERT(forest.isAllocated(v));
        ASSERT_EQUALS(forest.base(v), v);
        ASSERT_EQUALS(forest.topLevel(v), v);
        ASSERT_EQUALS(forest.parent(v), kNoBlossom);
    }
    ASSERT_FALSE(forest.isVertex(4));
    ASSERT_FALSE(forest.isAllocated(4));
    ASSERT(forest.nonTrivialBlossoms().empty());
    ASSERT_OK(forest.checkConsistency());
}

TEST(BlossomForestTest, AllocatesLowestFreeIdFirst) {
    BlossomForest forest(4);
    ASSERT_EQUALS(forest.allocate(), 4);
    ASSERT_EQUALS(forest.allocate(), 5);
    ASSERT_EQUALS(forest.allocate(), 6);
    forest.release(5);
    forest.release(4);
    ASSERT_EQUALS(forest.allocate(), 4);
    ASSERT_EQUALS(forest.allocate(), 5);
    ASSERT_EQUALS(forest.allocate(), 7);
    ASSERT_EQUALS(forest.nonTrivialBlossoms(), (std::vector<BlossomId>{4, 5, 6, 7}));
}

TEST(BlossomForestTest, ReleaseClearsStructure) {
    BlossomForest forest(3);
    const BlossomId b = contractTriangle(forest);
    for (VertexId v : {0, 1, 2}) {
        forest.setParent(v, kNoBlossom);
        forest.setTopLevel(v, v);
    }
    forest.release(b);
    ASSERT_FALSE(forest.isAllocated(b));
    ASSERT(forest.children(b).empty());
    ASSERT(forest.edges(b).empty());
    ASSERT_EQUALS(forest.base(b), kNoVertex);
    ASSERT_OK(forest.checkConsistency());
}

TEST(BlossomForestTest, LeavesOfNestedBlossom) {
    BlossomForest forest(5);
    const BlossomId inner = contractTriangle(forest);
    const BlossomId outer = forest.allocate();
    forest.setBase(outer, 0);
    forest.children(outer) = {inner, 3, 4};
    forest.edges(outer) = {{2, 3, 3}, {3, 4, 4}, {4, 0, 5}};
    for (BlossomId child : {inner, 3, 4})
        forest.setParent(child, outer);
    for (VertexId v = 0; v < 5; ++v)
        forest.setTopLevel(v, outer);

    ASSERT_EQUALS(forest.leaves(outer), (std::vector<VertexId>{0, 1, 2, 3, 4}));
    ASSERT_EQUALS(forest.leaves(inner), (std::vector<VertexId>{0, 1, 2}));
    ASSERT_EQUALS(forest.leaves(3), (std::vector<VertexId>{3}));
    ASSERT_EQUALS(forest.childIndex(outer, 4), 2U);
    ASSERT_OK(forest.checkConsistency());
}

TEST(BlossomForestTest, RotateMovesChildToFront) {
    BlossomForest forest(3);
    const BlossomId b = contractTriangle(forest);
    forest.rotate(b, 2);
    ASSERT_EQUALS(forest.children(b), (std::vector<BlossomId>{2, 0, 1}));
    ASSERT(forest.edges(b).front() == (HalfEdge{2, 0, 2}));
    ASSERT(forest.edges(b).back() == (HalfEdge{1, 2, 1}));
}

TEST(BlossomForestTest, ConsistencyRejectsStaleTopLevel) {
    BlossomForest forest(3);
    contractTriangle(forest);
    forest.setTopLevel(1, 1);
    ASSERT_EQUALS(forest.checkConsistency(), ErrorCodes::InternalError);
}

TEST(BlossomForestTest, ConsistencyRejectsEvenCycle) {
    BlossomForest forest(4);
    const BlossomId b = contractTriangle(forest);
    forest.children(b).push_back(3);
    forest.edges(b).push_back({3, 0, 3});
    forest.setParent(3, b);
    forest.setTopLevel(3, b);
    ASSERT_EQUALS(forest.checkConsistency(), ErrorCodes::InternalError);
}

TEST(BlossomForestTest, HalfEdgeReversed) {
    const HalfEdge he{3, 7, 11};
    ASSERT(he.reversed() == (HalfEdge{7, 3, 11}));
    ASSERT(he.reversed().reversed() == he);
}

}  // namespace
}  // namespace edmonds
