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

#include <cstddef>
#include <vector>

namespace edmonds {

using VertexId = int;
using EdgeId = int;

constexpr VertexId kNoVertex = -1;
constexpr EdgeId kNoEdge = -1;

/**
 * Dense form of a simple undirected graph as seen by the matching solver.
 *
 * Vertices are [0, numVertices). Self-loops are never present. adjacency[v] lists the edges
 * incident to v in insertion order.
 */
template <typename W>
struct IndexedGraph {
    struct Edge {
        VertexId u;
        VertexId v;
        W weight;
    };

    explicit IndexedGraph(int n = 0) : numVertices(n), adjacency(n) {}

    EdgeId addEdge(VertexId u, VertexId v, W weight) {
        const EdgeId e = static_cast<EdgeId>(edges.size());
        edges.push_back({u, v, weight});
        adjacency[u].push_back(e);
        adjacency[v].push_back(e);
        if (weight > maxWeight)
            maxWeight = weight;
        return e;
    }

    VertexId other(EdgeId e, VertexId from) const {
        const Edge& edge = edges[e];
        return edge.u == from ? edge.v : edge.u;
    }

    int numVertices;
    std::vector<Edge> edges;
    std::vector<std::vector<EdgeId>> adjacency;

    // Largest edge weight, never below zero.
    W maxWeight{0};

    // Whether every input weight was an exact integer.
    bool allInteger = true;
};

}  // namespace edmonds
