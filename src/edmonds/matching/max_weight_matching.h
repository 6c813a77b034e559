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

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "edmonds/graph/graph.h"
#include "edmonds/matching/graph_adapter.h"
#include "edmonds/matching/indexed_graph.h"
#include "edmonds/matching/matching_options.h"
#include "edmonds/util/assert_util.h"
#include "edmonds/util/str.h"

namespace edmonds {

/**
 * A set of matched node pairs. Every pair is stored once, with first < second.
 */
template <typename Node>
using Matching = std::set<std::pair<Node, Node>>;

namespace matching_detail {

/**
 * Solves `graph` and returns the mate of every vertex (kNoVertex if exposed). The integer
 * overload also checks the optimality certificate when options.verifyOptimum is set.
 */
std::vector<VertexId> computeMates(const IndexedGraph<std::int64_t>& graph,
                                   const MatchingOptions& options);
std::vector<VertexId> computeMates(const IndexedGraph<double>& graph,
                                   const MatchingOptions& options);

template <typename Node>
Matching<Node> toMatching(const BasicGraph<Node>& graph, const std::vector<VertexId>& mates) {
    const auto& nodes = graph.nodes();
    Matching<Node> matching;
    for (VertexId v = 0; v < static_cast<VertexId>(mates.size()); ++v) {
        const VertexId w = mates[v];
        if (w != kNoVertex && nodes[v] < nodes[w])
            matching.emplace(nodes[v], nodes[w]);
    }
    return matching;
}

}  // namespace matching_detail

/**
 * Computes a maximum-weight matching of `graph`.
 *
 * With options.maxCardinality set, only maximum-cardinality matchings are considered and
 * one of maximum weight among them is returned. Edges without options.weightAttribute weigh
 * 1. Self-loops are ignored.
 *
 * Throws AssertionException with GraphKindNotSupported for directed graphs and multigraphs,
 * with BadValue for invalid options or weights that options.weightMode cannot represent,
 * and with MatchingNotOptimal if the optimality check of integer mode fails.
 */
template <typename Node>
Matching<Node> maxWeightMatching(const BasicGraph<Node>& graph, const MatchingOptions& options) {
    uassertStatusOK(options.validate());
    uassertMatchableGraph(graph);

    std::vector<VertexId> mates;
    switch (options.weightMode) {
        case WeightMode::kInteger:
            mates = matching_detail::computeMates(
                adaptGraph<std::int64_t>(graph, options.weightAttribute), options);
            break;
        case WeightMode::kReal:
            mates = matching_detail::computeMates(
                adaptGraph<double>(graph, options.weightAttribute), options);
            break;
    }
    return matching_detail::toMatching(graph, mates);
}

template <typename Node>
Matching<Node> maxWeightMatching(const BasicGraph<Node>& graph,
                                 bool maxCardinality = false,
                                 const std::string& weight = "weight") {
    MatchingOptions options;
    options.maxCardinality = maxCardinality;
    options.weightAttribute = weight;
    return maxWeightMatching(graph, options);
}

/**
 * Computes a minimum-weight matching among the maximum-cardinality matchings of `graph`.
 *
 * Every weight w is replaced by (1 + maxWeight) - w, where maxWeight is the largest weight
 * of a non-loop edge, and the result is solved with maxCardinality forced on.
 *
 * In integer mode the rewritten weights must stay within the integer range too, so the spread
 * between the largest and smallest weight may not exceed 2^50 - 1. Throws BadValue otherwise.
 */
template <typename Node>
Matching<Node> minWeightMatching(const BasicGraph<Node>& graph, const MatchingOptions& options) {
    uassertStatusOK(options.validate());
    uassertMatchableGraph(graph);

    const auto& edges = graph.edges();
    double maxWeight = -std::numeric_limits<double>::infinity();
    for (std::size_t e = 0; e < edges.size(); ++e) {
        const auto& [a, b] = graph.edgeEnds(e);
        if (a != b) {
            maxWeight = std::max(
                maxWeight, BasicGraph<Node>::weightOf(edges[e].attributes, options.weightAttribute));
        }
    }
    if (maxWeight == -std::numeric_limits<double>::infinity())
        return {};

    BasicGraph<Node> inverted(graph.kind());
    for (const Node& node : graph.nodes())
        inverted.addNode(node);
    for (std::size_t e = 0; e < edges.size(); ++e) {
        const auto& [a, b] = graph.edgeEnds(e);
        if (a == b)
            continue;
        const double w = BasicGraph<Node>::weightOf(edges[e].attributes, options.weightAttribute);
        const double rewritten = (1 + maxWeight) - w;
        if (options.weightMode == WeightMode::kInteger && std::isfinite(rewritten)) {
            uassert(ErrorCodes::BadValue,
                    str::stream() << "minimum-weight matching rewrites the weight " << w
                                  << " of edge " << e << " to (1 + " << maxWeight << ") - " << w
                                  << ", which is outside the supported integer range",
                    std::fabs(rewritten) <= kMaxIntegerWeight);
        }
        inverted.addWeightedEdge(edges[e].u, edges[e].v, rewritten, options.weightAttribute);
    }

    MatchingOptions inner = options;
    inner.maxCardinality = true;
    return maxWeightMatching(inverted, inner);
}

template <typename Node>
Matching<Node> minWeightMatching(const BasicGraph<Node>& graph,
                                 const std::string& weight = "weight") {
    MatchingOptions options;
    options.weightAttribute = weight;
    return minWeightMatching(graph, options);
}

}  // namespace edmonds
