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

#include <cmath>
#include <cstdint>
#include <string>
#include <type_traits>

#include "edmonds/graph/graph.h"
#include "edmonds/matching/indexed_graph.h"
#include "edmonds/util/assert_util.h"
#include "edmonds/util/str.h"

namespace edmonds {

// Largest magnitude accepted in integer mode. Doubled duals and slacks stay far below the
// int64 range.
constexpr double kMaxIntegerWeight = 1125899906842624.0;  // 2^50

/**
 * Throws GraphKindNotSupported unless `graph` is a simple undirected graph.
 */
template <typename Node>
void uassertMatchableGraph(const BasicGraph<Node>& graph) {
    uassert(ErrorCodes::GraphKindNotSupported,
            str::stream() << "matching is not defined for directed graphs, got a "
                          << toString(graph.kind()),
            !graph.isDirected());
    uassert(ErrorCodes::GraphKindNotSupported,
            str::stream() << "matching is not defined for multigraphs, got a "
                          << toString(graph.kind()),
            !graph.isMultigraph());
}

namespace graph_adapter_detail {

template <typename W>
W convertWeight(double weight, std::size_t edgeIndex) {
    uassert(ErrorCodes::BadValue,
            str::stream() << "weight of edge " << edgeIndex << " is not finite: " << weight,
            std::isfinite(weight));
    if constexpr (std::is_integral_v<W>) {
        uassert(ErrorCodes::BadValue,
                str::stream() << "integer weights requested but edge " << edgeIndex
                              << " has weight " << weight,
                std::trunc(weight) == weight);
        uassert(ErrorCodes::BadValue,
                str::stream() << "weight " << weight << " of edge " << edgeIndex
                              << " is outside the supported integer range",
                std::fabs(weight) <= kMaxIntegerWeight);
        return static_cast<W>(weight);
    } else {
        return weight;
    }
}

}  // namespace graph_adapter_detail

/**
 * Builds the solver's view of `graph`. Vertex i is graph.nodes()[i]. Self-loops are dropped,
 * and an edge without `weightAttribute` weighs 1.
 *
 * Throws GraphKindNotSupported for directed graphs and multigraphs, and BadValue for weights
 * the arithmetic W cannot represent exactly.
 */
template <typename W, typename Node>
IndexedGraph<W> adaptGraph(const BasicGraph<Node>& graph, const std::string& weightAttribute) {
    uassertMatchableGraph(graph);

    IndexedGraph<W> indexed(static_cast<int>(graph.numberOfNodes()));
    const auto& edges = graph.edges();
    for (std::size_t e = 0; e < edges.size(); ++e) {
        const auto& [a, b] = graph.edgeEnds(e);
        if (a == b)
            continue;
        const double raw = BasicGraph<Node>::weightOf(edges[e].attributes, weightAttribute);
        const W weight = graph_adapter_detail::convertWeight<W>(raw, e);
        indexed.allInteger = indexed.allInteger && std::trunc(raw) == raw;
        indexed.addEdge(static_cast<VertexId>(a), static_cast<VertexId>(b), weight);
    }
    return indexed;
}

}  // namespace edmonds
