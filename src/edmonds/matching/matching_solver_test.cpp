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
#include <random>
#include <vector>

#include "edmonds/matching/matching_solver.h"
#include "edmonds/matching/optimality_verifier.h"
#include "edmonds/unittest/unittest.h"

namespace edmonds {
namespace {

IndexedGraph<std::int64_t> makeIndexed(int n, const std::vector<std::vector<int>>& edges) {
    IndexedGraph<std::int64_t> g(n);
    for (const auto& e : edges)
        g.addEdge(e[0], e[1], e[2]);
    return g;
}

int countMatched(const std::vector<VertexId>& mates) {
    int matched = 0;
    for (VertexId v = 0; v < static_cast<VertexId>(mates.size()); ++v) {
        if (mates[v] != kNoVertex && mates[mates[v]] == v)
            ++matched;
    }
    return matched / 2;
}

TEST(MatchingSolverTest, EmptyGraph) {
    IndexedGraph<std::int64_t> g(0);
    MatchingSolver<std::int64_t> solver(g, false);
    solver.solve();
    ASSERT(solver.mates().empty());
    ASSERT_EQUALS(solver.stages(), 0);
    ASSERT_OK(verifyOptimality(solver.certificate()));
}

TEST(MatchingSolverTest, OneStagePerAugmentation) {
    // The nested blossom fixture: 1-based node k is vertex k - 1.
    auto g = makeIndexed(10,
                         {{0, 1, 45},
                          {0, 4, 45},
                          {1, 2, 50},
                          {2, 3, 45},
                          {3, 4, 50},
                          {0, 5, 30},
                          {2, 8, 35},
                          {3, 7, 35},
                          {4, 6, 26},
                          {8, 9, 5}});
    MatchingSolver<std::int64_t> solver(g, false);
    solver.solve();
    ASSERT_EQUALS(solver.mates(), (std::vector<VertexId>{5, 2, 1, 7, 6, 0, 4, 3, 9, 8}));
    ASSERT_EQUALS(solver.stages(), 5);
    ASSERT_OK(verifyOptimality(solver.certificate()));
}

TEST(MatchingSolverTest, CertificateDescribesFinalState) {
    auto g = makeIndexed(4, {{0, 1, 8}, {0, 2, 9}, {1, 2, 10}, {2, 3, 7}});
    MatchingSolver<std::int64_t> solver(g, false);
    solver.solve();

    const auto c = solver.certificate();
    ASSERT_EQUALS(c.numVertices, 4);
    ASSERT_FALSE(c.maxCardinality);
    ASSERT_EQUALS(c.edges.size(), 4U);
    ASSERT_EQUALS(c.mate, solver.mates());
    ASSERT_EQUALS(c.vertexDual.size(), 4U);
    ASSERT_EQUALS(c.parent.size(), 8U);
    ASSERT_EQUALS(c.blossomDual.size(), 8U);
    ASSERT_EQUALS(c.blossomEdges.size(), 8U);
    for (std::int64_t dual : c.blossomDual)
        ASSERT_GREATER_THAN_OR_EQUALS(dual, 0);
    ASSERT_OK(verifyOptimality(c));
}

TEST(MatchingSolverTest, TamperedCertificateIsRejected) {
    auto g = makeIndexed(4, {{0, 1, 5}, {1, 2, 11}, {2, 3, 5}});
    MatchingSolver<std::int64_t> solver(g, false);
    solver.solve();
    auto c = solver.certificate();
    ASSERT_OK(verifyOptimality(c));

    // Matching the two light outer edges instead is not optimal under these duals.
    c.mate = {1, 0, 3, 2};
    ASSERT_EQUALS(verifyOptimality(c), ErrorCodes::MatchingNotOptimal);
}

TEST(MatchingSolverTest, MaxCardinalityDualsVerify) {
    auto g = makeIndexed(4, {{0, 1, 2}, {0, 2, -2}, {1, 2, 1}, {1, 3, -1}, {2, 3, -6}});
    MatchingSolver<std::int64_t> solver(g, true);
    solver.solve();
    ASSERT_EQUALS(solver.mates(), (std::vector<VertexId>{2, 3, 0, 1}));
    ASSERT_OK(verifyOptimality(solver.certificate()));
}

TEST(MatchingSolverTest, RandomGraphsProduceValidCertificates) {
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> numVertices(2, 40);
    std::uniform_int_distribution<int> weight(0, 100);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    for (int round = 0; round < 100; ++round) {
        const int n = numVertices(rng);
        const double density = coin(rng);
        IndexedGraph<std::int64_t> g(n);
        for (VertexId u = 0; u < n; ++u) {
            for (VertexId v = u + 1; v < n; ++v) {
                if (coin(rng) < density)
                    g.addEdge(u, v, weight(rng));
            }
        }
        for (bool maxCardinality : {false, true}) {
            MatchingSolver<std::int64_t> solver(g, maxCardinality);
            solver.solve();
            ASSERT_EQUALS(countMatched(solver.mates()), solver.stages());
            ASSERT_OK(verifyOptimality(solver.certificate()));
        }
    }
}

TEST(MatchingSolverTest, RealAndIntegerArithmeticAgree) {
    std::mt19937 rng(777);
    std::uniform_int_distribution<int> weight(1, 50);
    for (int round = 0; round < 50; ++round) {
        const int n = 12;
        IndexedGraph<std::int64_t> gi(n);
        IndexedGraph<double> gd(n);
        for (VertexId u = 0; u < n; ++u) {
            for (VertexId v = u + 1; v < n; ++v) {
                if (weight(rng) % 3 == 0) {
                    const int w = weight(rng);
                    gi.addEdge(u, v, w);
                    gd.addEdge(u, v, w);
                }
            }
        }
        MatchingSolver<std::int64_t> integral(gi, false);
        MatchingSolver<double> real(gd, false);
        integral.solve();
        real.solve();
        ASSERT_EQUALS(integral.mates(), real.mates());
    }
}

}  // namespace
}  // namespace edmonds
