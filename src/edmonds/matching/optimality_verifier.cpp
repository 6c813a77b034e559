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

#include "edmonds/matching/optimality_verifier.h"

#include <algorithm>

#include "edmonds/util/str.h"

namespace edmonds {

namespace {

Status notOptimal(const std::string& reason) {
    return {ErrorCodes::MatchingNotOptimal, reason};
}

std::vector<BlossomId> ancestorsFromRoot(const DualCertificate<std::int64_t>& c, VertexId v) {
    std::vector<BlossomId> chain{v};
    while (c.parent[chain.back()] != kNoBlossom)
        chain.push_back(c.parent[chain.back()]);
    std::reverse(chain.begin(), chain.end());
    return chain;
}

bool isMatchedPair(const DualCertificate<std::int64_t>& c, VertexId v, VertexId w) {
    return c.mate[v] == w && c.mate[w] == v;
}

}  // namespace

Status verifyOptimality(const DualCertificate<std::int64_t>& c) {
    const int n = c.numVertices;
    if (n == 0)
        return Status::OK();

    for (VertexId v = 0; v < n; ++v) {
        const VertexId w = c.mate[v];
        if (w != kNoVertex && (w < 0 || w >= n || c.mate[w] != v)) {
            return notOptimal(str::stream() << "mate of vertex " << v << " is " << w
                                            << " but not vice versa");
        }
    }

    const std::int64_t minVertexDual = *std::min_element(c.vertexDual.begin(), c.vertexDual.end());
    // With maxCardinality, vertex duals may end up negative; shift them all by the same
    // non-negative amount.
    const std::int64_t offset = c.maxCardinality ? std::max<std::int64_t>(0, -minVertexDual) : 0;

    if (minVertexDual + offset < 0)
        return notOptimal(str::stream() << "negative vertex dual " << minVertexDual);
    for (BlossomId b = n; b < 2 * n; ++b) {
        if (c.blossomDual[b] < 0)
            return notOptimal(str::stream() << "blossom " << b << " has negative dual "
                                            << c.blossomDual[b]);
    }

    std::vector<int> matchedEdges(n, 0);
    for (std::size_t e = 0; e < c.edges.size(); ++e) {
        const auto& edge = c.edges[e];
        std::int64_t s = c.vertexDual[edge.u] + c.vertexDual[edge.v] - 2 * edge.weight;
        const auto iChain = ancestorsFromRoot(c, edge.u);
        const auto jChain = ancestorsFromRoot(c, edge.v);
        for (std::size_t k = 0; k < std::min(iChain.size(), jChain.size()); ++k) {
            if (iChain[k] != jChain[k])
                break;
            s += 2 * c.blossomDual[iChain[k]];
        }
        if (s < 0) {
            return notOptimal(str::stream() << "edge " << edge.u << " - " << edge.v
                                            << " has negative slack " << s);
        }
        if (isMatchedPair(c, edge.u, edge.v)) {
            if (s != 0) {
                return notOptimal(str::stream() << "matched edge " << edge.u << " - " << edge.v
                                                << " has slack " << s);
            }
            ++matchedEdges[edge.u];
            ++matchedEdges[edge.v];
        }
    }

    for (VertexId v = 0; v < n; ++v) {
        if (c.mate[v] == kNoVertex) {
            if (c.vertexDual[v] + offset != 0) {
                return notOptimal(str::stream() << "exposed vertex " << v << " has dual "
                                                << c.vertexDual[v] + offset);
            }
        } else if (matchedEdges[v] == 0) {
            return notOptimal(str::stream() << "vertex " << v << " is matched to " << c.mate[v]
                                            << " without an edge");
        }
    }

    for (BlossomId b = n; b < 2 * n; ++b) {
        if (c.blossomDual[b] <= 0)
            continue;
        const auto& edges = c.blossomEdges[b];
        if (edges.size() % 2 != 1) {
            return notOptimal(str::stream() << "blossom " << b << " has " << edges.size()
                                            << " edges");
        }
        for (std::size_t i = 1; i < edges.size(); i += 2) {
            if (!isMatchedPair(c, edges[i].from, edges[i].to)) {
                return notOptimal(str::stream() << "blossom " << b << " with positive dual is "
                                                << "not full at edge " << edges[i].from << " - "
                                                << edges[i].to);
            }
        }
    }

    return Status::OK();
}

}  // namespace edmonds
