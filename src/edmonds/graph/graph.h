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
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "edmonds/base/status.h"
#include "edmonds/base/status_with.h"
#include "edmonds/util/assert_util.h"
#include "edmonds/util/str.h"

namespace edmonds {

enum class GraphKind { kGraph, kDiGraph, kMultiGraph, kMultiDiGraph };

std::string toString(GraphKind kind);

inline bool isDirected(GraphKind kind) {
    return kind == GraphKind::kDiGraph || kind == GraphKind::kMultiDiGraph;
}

inline bool isMultigraph(GraphKind kind) {
    return kind == GraphKind::kMultiGraph || kind == GraphKind::kMultiDiGraph;
}

/**
 * Numeric edge attributes, keyed by name. The weight of an edge is the attribute named by the
 * caller, "weight" by default.
 */
using EdgeAttributes = std::map<std::string, double>;

constexpr double kDefaultEdgeWeight = 1.0;

/**
 * An in-memory graph over caller-supplied node values.
 *
 * Nodes and edges are kept in insertion order, and every traversal (nodes(), edges(),
 * neighbors()) reports them in that order, so algorithms running over a BasicGraph are
 * deterministic.
 *
 * For the simple kinds (kGraph, kDiGraph) adding an edge that already exists merges the new
 * attributes into the existing edge. The multigraph kinds keep every parallel edge.
 * In undirected graphs (u, v) and (v, u) name the same edge.
 *
 * Node must be copyable and totally ordered by operator<. Error messages stream nodes with
 * operator<<.
 */
template <typename Node>
class BasicGraph {
public:
    struct Edge {
        Node u;
        Node v;
        EdgeAttributes attributes;
    };

    explicit BasicGraph(GraphKind kind = GraphKind::kGraph) : _kind(kind) {}

    GraphKind kind() const {
        return _kind;
    }

    bool isDirected() const {
        return edmonds::isDirected(_kind);
    }

    bool isMultigraph() const {
        return edmonds::isMultigraph(_kind);
    }

    /**
     * Adds `node` if it is not already present.
     */
    void addNode(const Node& node) {
        _indexFor(node);
    }

    /**
     * Adds an edge between `u` and `v`, adding either node if needed.
     */
    void addEdge(const Node& u, const Node& v, const EdgeAttributes& attributes = {}) {
        const std::size_t iu = _indexFor(u);
        const std::size_t iv = _indexFor(v);
        if (!isMultigraph()) {
            auto it = _lookup.find(_key(iu, iv));
            if (it != _lookup.end() && !it->second.empty()) {
                for (const auto& [name, value] : attributes)
                    _edges[it->second.front()].attributes[name] = value;
                return;
            }
        }
        const std::size_t e = _edges.size();
        _edges.push_back({u, v, attributes});
        _ends.emplace_back(iu, iv);
        _lookup[_key(iu, iv)].push_back(e);
        _adjacency[iu].push_back(e);
        if (iu != iv && !isDirected())
            _adjacency[iv].push_back(e);
    }

    void addWeightedEdge(const Node& u,
                         const Node& v,
                         double weight,
                         const std::string& weightAttribute = "weight") {
        addEdge(u, v, EdgeAttributes{{weightAttribute, weight}});
    }

    void addWeightedEdges(const std::vector<std::tuple<Node, Node, double>>& edges,
                          const std::string& weightAttribute = "weight") {
        for (const auto& [u, v, w] : edges)
            addWeightedEdge(u, v, w, weightAttribute);
    }

    /**
     * Removes the edge between `u` and `v`; in a multigraph, the most recently added one.
     * Returns NoSuchKey if there is no such edge.
     */
    Status removeEdge(const Node& u, const Node& v) {
        auto iu = indexOf(u);
        auto iv = indexOf(v);
        if (!iu || !iv)
            return {ErrorCodes::NoSuchKey, str::stream() << "no edge " << u << " - " << v};
        auto it = _lookup.find(_key(*iu, *iv));
        if (it == _lookup.end() || it->second.empty())
            return {ErrorCodes::NoSuchKey, str::stream() << "no edge " << u << " - " << v};

        const std::size_t doomed = it->second.back();
        _edges.erase(_edges.begin() + doomed);
        _ends.erase(_ends.begin() + doomed);
        _rebuildIndexes();
        return Status::OK();
    }

    bool hasNode(const Node& node) const {
        return _index.count(node) > 0;
    }

    bool hasEdge(const Node& u, const Node& v) const {
        auto iu = indexOf(u);
        auto iv = indexOf(v);
        if (!iu || !iv)
            return false;
        auto it = _lookup.find(_key(*iu, *iv));
        return it != _lookup.end() && !it->second.empty();
    }

    /**
     * Position of `node` in nodes(), if present.
     */
    boost::optional<std::size_t> indexOf(const Node& node) const {
        auto it = _index.find(node);
        if (it == _index.end())
            return boost::none;
        return it->second;
    }

    const std::vector<Node>& nodes() const {
        return _nodes;
    }

    const std::vector<Edge>& edges() const {
        return _edges;
    }

    /**
     * Endpoint positions (in nodes()) of edges()[e].
     */
    const std::pair<std::size_t, std::size_t>& edgeEnds(std::size_t e) const {
        return _ends[e];
    }

    /**
     * Distinct neighbors of `node` (successors in a directed graph), in the order the
     * connecting edges were added. Returns NoSuchKey if the node is absent.
     */
    StatusWith<std::vector<Node>> neighbors(const Node& node) const {
        auto in = indexOf(node);
        if (!in)
            return {ErrorCodes::NoSuchKey,
                    str::stream() << "node " << node << " is not in the graph"};
        std::vector<Node> result;
        std::vector<bool> seen(_nodes.size(), false);
        for (std::size_t e : _adjacency[*in]) {
            const auto& [a, b] = _ends[e];
            const std::size_t other = a == *in ? b : a;
            if (!seen[other]) {
                seen[other] = true;
                result.push_back(_nodes[other]);
            }
        }
        return result;
    }

    /**
     * Attributes of the edge between `u` and `v`; in a multigraph, of the first such edge.
     */
    StatusWith<EdgeAttributes> edgeData(const Node& u, const Node& v) const {
        auto iu = indexOf(u);
        auto iv = indexOf(v);
        if (iu && iv) {
            auto it = _lookup.find(_key(*iu, *iv));
            if (it != _lookup.end() && !it->second.empty())
                return _edges[it->second.front()].attributes;
        }
        return {ErrorCodes::NoSuchKey, str::stream() << "no edge " << u << " - " << v};
    }

    /**
     * The `weightAttribute` of the edge between `u` and `v`, or kDefaultEdgeWeight if the
     * edge exists but does not carry that attribute.
     */
    StatusWith<double> edgeWeight(const Node& u,
                                  const Node& v,
                                  const std::string& weightAttribute = "weight") const {
        auto data = edgeData(u, v);
        if (!data.isOK())
            return data.getStatus();
        return weightOf(data.getValue(), weightAttribute);
    }

    static double weightOf(const EdgeAttributes& attributes, const std::string& weightAttribute) {
        auto it = attributes.find(weightAttribute);
        return it == attributes.end() ? kDefaultEdgeWeight : it->second;
    }

    std::size_t numberOfNodes() const {
        return _nodes.size();
    }

    std::size_t numberOfEdges() const {
        return _edges.size();
    }

    std::size_t numberOfSelfLoops() const {
        std::size_t loops = 0;
        for (const auto& [a, b] : _ends)
            if (a == b)
                ++loops;
        return loops;
    }

private:
    std::size_t _indexFor(const Node& node) {
        auto [it, inserted] = _index.emplace(node, _nodes.size());
        if (inserted) {
            _nodes.push_back(node);
            _adjacency.emplace_back();
        }
        return it->second;
    }

    std::pair<std::size_t, std::size_t> _key(std::size_t a, std::size_t b) const {
        if (!isDirected() && b < a)
            std::swap(a, b);
        return {a, b};
    }

    void _rebuildIndexes() {
        _lookup.clear();
        for (auto& adjacent : _adjacency)
            adjacent.clear();
        for (std::size_t e = 0; e < _ends.size(); ++e) {
            const auto& [a, b] = _ends[e];
            _lookup[_key(a, b)].push_back(e);
            _adjacency[a].push_back(e);
            if (a != b && !isDirected())
                _adjacency[b].push_back(e);
        }
    }

    GraphKind _kind;

    std::vector<Node> _nodes;
    std::map<Node, std::size_t> _index;

    std::vector<Edge> _edges;
    std::vector<std::pair<std::size_t, std::size_t>> _ends;

    // Canonical endpoint pair to the edges joining them, in insertion order.
    std::map<std::pair<std::size_t, std::size_t>, std::vector<std::size_t>> _lookup;

    // Node position to incident edges (outgoing edges for directed kinds).
    std::vector<std::vector<std::size_t>> _adjacency;
};

using Graph = BasicGraph<int>;

}  // namespace edmonds
