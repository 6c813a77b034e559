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

#include <cstdint>
#include <vector>

#include "edmonds/matching/optimality_verifier.h"
#include "edmonds/unittest/unittest.h"

namespace edmonds {
namespace {

using Certificate = DualCertificate<std::int64_t>;

Certificate makeCertificate(int n,
                            std::vector<IndexedGraph<std::int64_t>::Edge> edges,
                            std::vector<VertexId> mate,
                            std::vector<std::int64_t> vertexDual) {
    Certificate c;
    c.numVertices = n;
    c.edges = std::move(edges);
    c.mate = std::move(mate);
    c.vertexDual = std::move(vertexDual);
    c.parent.assign(2 * n, kNoBlossom);
    c.blossomDual.assign(2 * n, 0);
    c.blossomEdges.resize(2 * n);
    return c;
}

// Triangle 0-1-2 of weight 2 with 0-1 matched, contracted into blossom 3 based at 2.
Certificate triangleInBlossom() {
    auto c = makeCertificate(3, {{0, 1, 2}, {1, 2, 2}, {2, 0, 2}}, {1, 0, kNoVertex}, {0, 0, 0});
    for (VertexId v : {0, 1, 2})
        c.parent[v] = 3;
    c.blossomDual[3] = 2;
    c.blossomEdges[3] = {{2, 0, 2}, {0, 1, 0}, {1, 2, 1}};
    return c;
}

TEST(OptimalityVerifierTest, EmptyGraph) {
    ASSERT_OK(verifyOptimality(makeCertificate(0, {}, {}, {})));
}

TEST(OptimalityVerifierTest, SingleTightEdge) {
    ASSERT_OK(verifyOptimality(makeCertificate(2, {{0, 1, 5}}, {1, 0}, {5, 5})));
}

TEST(OptimalityVerifierTest, BlossomCertificate) {
    ASSERT_OK(verifyOptimality(triangleInBlossom()));
}

TEST(OptimalityVerifierTest, AsymmetricMate) {
    auto c = makeCertificate(3, {{0, 1, 5}}, {1, 2, kNoVertex}, {5, 5, 0});
    ASSERT_EQUALS(verifyOptimality(c), ErrorCodes::MatchingNotOptimal);
}

TEST(OptimalityVerifierTest, NegativeSlack) {
    auto c = makeCertificate(2, {{0, 1, 5}}, {1, 0}, {4, 5});
    ASSERT_EQUALS(verifyOptimality(c), ErrorCodes::MatchingNotOptimal);
}

TEST(OptimalityVerifierTest, MatchedEdgeNotTight) {
    auto c = makeCertificate(2, {{0, 1, 5}}, {1, 0}, {6, 6});
    ASSERT_EQUALS(verifyOptimality(c), ErrorCodes::MatchingNotOptimal);
}

TEST(OptimalityVerifierTest, ExposedVertexWithPositiveDual) {
    auto c = makeCertificate(3, {{0, 1, 5}}, {1, 0, kNoVertex}, {5, 5, 3});
    ASSERT_EQUALS(verifyOptimality(c), ErrorCodes::MatchingNotOptimal);
}

TEST(OptimalityVerifierTest, MatchedWithoutEdge) {
    auto c = makeCertificate(3, {{0, 1, 2}}, {2, kNoVertex, 0}, {4, 0, 0});
    auto status = verifyOptimality(c);
    ASSERT_EQUALS(status, ErrorCodes::MatchingNotOptimal);
    ASSERT_STRING_CONTAINS(status.reason(), "without an edge");
}

TEST(OptimalityVerifierTest, NegativeVertexDualNeedsMaxCardinality) {
    auto c = makeCertificate(2, {{0, 1, -2}}, {1, 0}, {-2, -2});
    ASSERT_EQUALS(verifyOptimality(c), ErrorCodes::MatchingNotOptimal);
    c.maxCardinality = true;
    ASSERT_OK(verifyOptimality(c));
}

TEST(OptimalityVerifierTest, NegativeBlossomDual) {
    auto c = triangleInBlossom();
    c.blossomDual[3] = -1;
    ASSERT_EQUALS(verifyOptimality(c), ErrorCodes::MatchingNotOptimal);
}

TEST(OptimalityVerifierTest, BlossomWithPositiveDualMustBeFull) {
    auto c = triangleInBlossom();
    // Same cycle, listed from vertex 0: the matched edge is no longer at an odd position.
    c.blossomEdges[3] = {{0, 1, 0}, {1, 2, 1}, {2, 0, 2}};
    auto status = verifyOptimality(c);
    ASSERT_EQUALS(status, ErrorCodes::MatchingNotOptimal);
    ASSERT_STRING_CONTAINS(status.reason(), "not full");
}

}  // namespace
}  // namespace edmonds
