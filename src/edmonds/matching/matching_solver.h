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

#include <cstdint>
#include <vector>

#include <boost/optional.hpp>

#include "edmonds/matching/blossom_forest.h"
#include "edmonds/matching/dual_variables.h"
#include "edmonds/matching/indexed_graph.h"
#include "edmonds/matching/optimality_verifier.h"

namespace edmonds {

/**
 * Maximum-weight matching on a general graph with Edmonds' blossom algorithm, in the
 * primal-dual formulation of Galil ("Efficient Algorithms for Finding Maximum Matching in
 * Graphs", ACM Computing Surveys, 1986). O(n^3).
 *
 * Each stage grows alternating trees from all exposed vertices until it finds an augmenting
 * path, contracting odd cycles into blossoms along the way. When the trees cannot grow, the
 * duals are adjusted by the largest delta that keeps them feasible, which makes a new edge
 * tight or lets a T-blossom be expanded. The search stops when the duals prove that no
 * augmenting path can increase the weight.
 *
 * All state belongs to one instance, which solves one graph once. Instances are independent.
 *
 * W is std::int64_t or double; both are instantiated in matching_solver.cpp.
 */
template <typename W>
class MatchingSolver {
public:
    /**
     * `graph` must outlive the solver. Edges with doubled slack <= epsilon are tight.
     */
    MatchingSolver(const IndexedGraph<W>& graph, bool maxCardinality, W epsilon = W{0});

    MatchingSolver(const MatchingSolver&) = delete;
    MatchingSolver& operator=(const MatchingSolver&) = delete;

    /**
     * Runs the algorithm to completion. May be called once.
     */
    void solve();

    /**
     * mates()[v] is the vertex matched to v, or kNoVertex.
     */
    const std::vector<VertexId>& mates() const {
        return _mate;
    }

    /**
     * The final matching with its duals and blossom structure.
     */
    DualCertificate<W> certificate() const;

    /**
     * Number of augmentations performed.
     */
    int stages() const {
        return _stages;
    }

private:
    enum Label : std::uint8_t { kFree = 0, kS = 1, kT = 2, kBreadcrumb = 4 };

    // Which bound limited the last dual update.
    enum class DeltaKind { kNone, kVertexDual, kFreeEdge, kSBlossomEdge, kTBlossomDual };

    static const char* _deltaKindName(DeltaKind kind);

    W _slack(EdgeId e) const {
        return _duals.slack(_graph.edges[e]);
    }

    W _slack(const HalfEdge& he) const {
        return _slack(he.edge);
    }

    std::size_t _wrap(long i, std::size_t size) const {
        const long k = static_cast<long>(size);
        return static_cast<std::size_t>(((i % k) + k) % k);
    }

    void _startStage();
    bool _growTrees();
    bool _deltaStep();
    void _expandZeroDualBlossoms();

    void _assignLabel(VertexId w, Label t, const boost::optional<HalfEdge>& via);
    VertexId _scanBlossom(VertexId v, VertexId w);
    void _addBlossom(VertexId base, const HalfEdge& vw);
    void _expandBlossom(BlossomId b, bool endStage);
    void _augmentBlossom(BlossomId b, VertexId v);
    void _augmentMatching(const HalfEdge& vw);
    void _match(VertexId v, VertexId w, EdgeId e);

    const IndexedGraph<W>& _graph;
    const int _n;
    const bool _maxCardinality;
    const W _epsilon;

    BlossomForest _forest;
    DualVariables<W> _duals;

    std::vector<VertexId> _mate;
    std::vector<EdgeId> _mateEdge;

    // Per vertex and blossom id. Reset at the start of every stage.
    std::vector<std::uint8_t> _label;
    std::vector<boost::optional<HalfEdge>> _labelEdge;
    std::vector<boost::optional<HalfEdge>> _bestEdge;
    std::vector<boost::optional<std::vector<HalfEdge>>> _blossomBestEdges;
    std::vector<bool> _allowed;
    std::vector<VertexId> _queue;

    bool _solved = false;
    int _stages = 0;
    int _substages = 0;
};

extern template class MatchingSolver<std::int64_t>;
extern template class MatchingSolver<double>;

}  // namespace edmonds
