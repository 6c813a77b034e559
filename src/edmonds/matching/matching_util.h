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

#include <map>
#include <set>
#include <utility>

#include "edmonds/graph/graph.h"
#include "edmonds/matching/graph_adapter.h"
#include "edmonds/matching/max_weight_matching.h"
#include "edmonds/util/assert_util.h"
#include "edmonds/util/str.h"

namespace edmonds {

namespace matching_detail {

template <typename Node>
void uassertHasNodes(const BasicGraph<Node>& graph, const std::pair<Node, Node>& pair) {
    uassert(ErrorCodes::NoSuchKey,
            str::stream() << "matched node " << pair.first << " is not in the graph",
            graph.hasNode(pair.first));
    uassert(ErrorCodes::NoSuchKey,
            str::stream() << "matched node " << pair.second << " is not in the graph",
            graph.hasNode(pair.second));
}

}  // namespace matching_detail

/**
 * Whether `matching` is a matching of `graph`: every pair is a non-loop edge of the graph and
 * no node appears twice. Throws NoSuchKey if a pair names a node absent from the graph.
 */
template <typename Node>
bool isMatching(const BasicGraph<Node>& graph, const Matching<Node>& matching) {
    std::set<Node> covered;
    for (const auto& pair : matching) {
        matching_detail::uassertHasNodes(graph, pair);
        const auto& [u, v] = pair;
        if (!(u < v) && !(v < u))
            return false;
        if (!graph.hasEdge(u, v))
            return false;
        if (!covered.insert(u).second || !covered.insert(v).second)
            return false;
    }
    return true;
}

/**
 * Whether `matching` is a matching to which no edge of `graph` can be added.
 */
template <typename Node>
bool isMaximalMatching(const BasicGraph<Node>& graph, const Matching<Node>& matching) {
    if (!isMatching(graph, matching))
        return false;
    std::set<Node> covered;
    for (const auto& [u, v] : matching) {
        covered.insert(u);
        covered.insert(v);
    }
    const auto& edges = graph.edges();
    for (std::size_t e = 0; e < edges.size(); ++e) {
        const auto& [a, b] = graph.edgeEnds(e);
        if (a == b)
            continue;
        if (!covered.count(edges[e].u) && !covered.count(edges[e].v))
            return false;
    }
    return true;
}

/**
 * Whether `matching` is a matching that covers every node of `graph`.
 */
template <typename Node>
bool isPerfectMatching(const BasicGraph<Node>& graph, const Matching<Node>& matching) {
    if (!isMatching(graph, matching))
        return false;
    return 2 * matching.size() == graph.numberOfNodes();
}

/**
 * A maximal matching built greedily in edge insertion order. Not in general of maximum
 * cardinality or weight.
 */
template <typename Node>
Matching<Node> maximalMatching(const BasicGraph<Node>& graph) {
    uassertMatchableGraph(graph);
    Matching<Node> matching;
    std::set<Node> covered;
    for (const auto& edge : graph.edges()) {
        if (!(edge.u < edge.v) && !(edge.v < edge.u))
            continue;
        if (covered.count(edge.u) || covered.count(edge.v))
            continue;
        covered.insert(edge.u);
        covered.insert(edge.v);
        if (edge.u < edge.v)
            matching.emplace(edge.u, edge.v);
        else
            matching.emplace(edge.v, edge.u);
    }
    return matching;
}

/**
 * Sum of the `weightAttribute` of the matched edges; edges without it weigh 1. Throws
 * NoSuchKey if a pair is not an edge of `graph`.
 */
template <typename Node>
double matchingWeight(const BasicGraph<Node>& graph,
                      const Matching<Node>& matching,
                      const std::string& weightAttribute = "weight") {
    double total = 0;
    for (const auto& [u, v] : matching)
        total += uassertStatusOK(graph.edgeWeight(u, v, weightAttribute));
    return total;
}

/**
 * Converts a mate map, in which each matched node may appear as a key, a value or both, to a
 * Matching. Throws BadValue if a node is mapped to itself.
 */
template <typename Node>
Matching<Node> mateMapToMatching(const std::map<Node, Node>& mate) {
    Matching<Node> matching;
    for (const auto& [u, v] : mate) {
        uassert(ErrorCodes::BadValue,
                str::stream() << "node " << u << " cannot be matched to itself",
                u < v || v < u);
        if (u < v)
            matching.emplace(u, v);
        else
            matching.emplace(v, u);
    }
    return matching;
}

}  // namespace edmonds
