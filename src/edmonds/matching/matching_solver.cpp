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

#define EDMONDS_LOGV2_DEFAULT_COMPONENT ::edmonds::logv2::LogComponent::kMatching

#include "edmonds/matching/matching_solver.h"

#include <algorithm>
#include <type_traits>
#include <utility>

#include "edmonds/logv2/log.h"
#include "edmonds/util/assert_util.h"

namespace edmonds {

namespace {

template <typename W>
W halfSlack(W slack) {
    if constexpr (std::is_integral_v<W>) {
        invariant(slack % 2 == 0, "odd slack between S-blossoms in integer mode");
        return slack / 2;
    } else {
        return slack / 2.0;
    }
}

}  // namespace

template <typename W>
const char* MatchingSolver<W>::_deltaKindName(DeltaKind kind) {
    switch (kind) {
        case DeltaKind::kNone:
            return "none";
        case DeltaKind::kVertexDual:
            return "vertexDual";
        case DeltaKind::kFreeEdge:
            return "freeEdge";
        case DeltaKind::kSBlossomEdge:
            return "sBlossomEdge";
        case DeltaKind::kTBlossomDual:
            return "tBlossomDual";
    }
    EDMONDS_UNREACHABLE;
}

template <typename W>
MatchingSolver<W>::MatchingSolver(const IndexedGraph<W>& graph, bool maxCardinality, W epsilon)
    : _graph(graph),
      _n(graph.numVertices),
      _maxCardinality(maxCardinality),
      _epsilon(epsilon),
      _forest(graph.numVertices),
      _duals(graph.numVertices, graph.maxWeight),
      _mate(graph.numVertices, kNoVertex),
      _mateEdge(graph.numVertices, kNoEdge),
      _label(2 * graph.numVertices, kFree),
      _labelEdge(2 * graph.numVertices),
      _bestEdge(2 * graph.numVertices),
      _blossomBestEdges(2 * graph.numVertices),
      _allowed(graph.edges.size(), false) {}

template <typename W>
void MatchingSolver<W>::solve() {
    invariant(!_solved, "MatchingSolver::solve() called twice");
    _solved = true;
    if (_n == 0)
        return;

    LOGV2_DEBUG(7100101,
                1,
                "Starting maximum weight matching",
                "vertices"_attr = _n,
                "edges"_attr = _graph.edges.size(),
                "maxWeight"_attr = _graph.maxWeight,
                "maxCardinality"_attr = _maxCardinality);

    // Each iteration is a stage: it either augments the matching by one edge or proves that
    // the current matching is optimal.
    while (true) {
        _startStage();

        bool augmented = false;
        while (true) {
            ++_substages;
            augmented = _growTrees();
            if (augmented)
                break;
            if (_deltaStep())
                break;
        }

        for (VertexId v = 0; v < _n; ++v)
            invariant(_mate[v] == kNoVertex || _mate[_mate[v]] == v);

        if (!augmented)
            break;

        ++_stages;
        _expandZeroDualBlossoms();
        dassert(_forest.checkConsistency().isOK());
    }

    LOGV2_DEBUG(7100102,
                1,
                "Finished maximum weight matching",
                "stages"_attr = _stages,
                "substages"_attr = _substages,
                "blossoms"_attr = _forest.nonTrivialBlossoms().size());
}

template <typename W>
void MatchingSolver<W>::_startStage() {
    std::fill(_label.begin(), _label.end(), kFree);
    std::fill(_labelEdge.begin(), _labelEdge.end(), boost::none);
    std::fill(_bestEdge.begin(), _bestEdge.end(), boost::none);
    std::fill(_blossomBestEdges.begin(), _blossomBestEdges.end(), boost::none);
    // Edges found tight under the previous labeling may not stay tight.
    std::fill(_allowed.begin(), _allowed.end(), false);
    _queue.clear();

    for (VertexId v = 0; v < _n; ++v) {
        if (_mate[v] == kNoVertex && _label[_forest.topLevel(v)] == kFree)
            _assignLabel(v, kS, boost::none);
    }

    LOGV2_DEBUG(7100103,
                2,
                "Stage {stage} starting with {roots} exposed vertices",
                "stage"_attr = _stages,
                "roots"_attr = _queue.size());
}

template <typename W>
bool MatchingSolver<W>::_growTrees() {
    while (!_queue.empty()) {
        const VertexId v = _queue.back();
        _queue.pop_back();
        invariant(_label[_forest.topLevel(v)] == kS);

        for (EdgeId e : _graph.adjacency[v]) {
            const VertexId w = _graph.other(e, v);
            const BlossomId bv = _forest.topLevel(v);
            const BlossomId bw = _forest.topLevel(w);
            if (bv == bw)
                continue;  // internal to a blossom

            W kslack{0};
            if (!_allowed[e]) {
                kslack = _slack(e);
                if (kslack <= _epsilon)
                    _allowed[e] = true;
            }

            const HalfEdge vw{v, w, e};
            if (_allowed[e]) {
                if (_label[bw] == kFree) {
                    // w is free: label it T and its mate S.
                    _assignLabel(w, kT, vw);
                } else if (_label[bw] == kS) {
                    // Two S-vertices in different blossoms: either a new blossom or an
                    // augmenting path.
                    const VertexId base = _scanBlossom(v, w);
                    if (base != kNoVertex) {
                        _addBlossom(base, vw);
                    } else {
                        _augmentMatching(vw);
                        return true;
                    }
                } else if (_label[w] == kFree) {
                    // w is inside a T-blossom but not yet reached from outside it. Remember
                    // the edge for relabeling when the blossom is expanded.
                    invariant(_label[bw] == kT);
                    _label[w] = kT;
                    _labelEdge[w] = vw;
                }
            } else if (_label[bw] == kS) {
                if (!_bestEdge[bv] || kslack < _slack(*_bestEdge[bv]))
                    _bestEdge[bv] = vw;
            } else if (_label[w] == kFree) {
                if (!_bestEdge[w] || kslack < _slack(*_bestEdge[w]))
                    _bestEdge[w] = vw;
            }
        }
    }
    return false;
}

template <typename W>
bool MatchingSolver<W>::_deltaStep() {
    // Duals and slacks are doubled, so every delta below is too.
    DeltaKind kind = DeltaKind::kNone;
    W delta{0};
    boost::optional<HalfEdge> deltaEdge;
    BlossomId deltaBlossom = kNoBlossom;

    // delta1: smallest vertex dual.
    if (!_maxCardinality) {
        kind = DeltaKind::kVertexDual;
        delta = _duals.minVertexDual();
    }

    // delta2: least slack of an edge from an S-vertex to a free vertex.
    for (VertexId v = 0; v < _n; ++v) {
        if (_label[_forest.topLevel(v)] == kFree && _bestEdge[v]) {
            const W d = _slack(*_bestEdge[v]);
            if (kind == DeltaKind::kNone || d < delta) {
                delta = d;
                kind = DeltaKind::kFreeEdge;
                deltaEdge = _bestEdge[v];
            }
        }
    }

    // delta3: half the least slack of an edge between two top-level S-blossoms.
    for (BlossomId b = 0; b < 2 * _n; ++b) {
        if (_forest.isAllocated(b) && _forest.parent(b) == kNoBlossom && _label[b] == kS &&
            _bestEdge[b]) {
            const W d = halfSlack(_slack(*_bestEdge[b]));
            if (kind == DeltaKind::kNone || d < delta) {
                delta = d;
                kind = DeltaKind::kSBlossomEdge;
                deltaEdge = _bestEdge[b];
            }
        }
    }

    // delta4: smallest dual of a top-level T-blossom.
    for (BlossomId b : _forest.nonTrivialBlossoms()) {
        if (_forest.parent(b) == kNoBlossom && _label[b] == kT &&
            (kind == DeltaKind::kNone || _duals.blossom(b) < delta)) {
            delta = _duals.blossom(b);
            kind = DeltaKind::kTBlossomDual;
            deltaBlossom = b;
        }
    }

    if (kind == DeltaKind::kNone) {
        // No further improvement is possible in max-cardinality mode. Do a final delta update
        // so that the duals form a valid certificate.
        invariant(_maxCardinality);
        kind = DeltaKind::kVertexDual;
        delta = std::max(W{0}, _duals.minVertexDual());
    }

    LOGV2_DEBUG(7100104,
                3,
                "Dual update",
                "stage"_attr = _stages,
                "kind"_attr = _deltaKindName(kind),
                "delta"_attr = delta);

    for (VertexId v = 0; v < _n; ++v) {
        const auto label = _label[_forest.topLevel(v)];
        if (label == kS)
            _duals.vertex(v) -= delta;
        else if (label == kT)
            _duals.vertex(v) += delta;
    }
    for (BlossomId b : _forest.nonTrivialBlossoms()) {
        if (_forest.parent(b) != kNoBlossom)
            continue;
        if (_label[b] == kS)
            _duals.blossom(b) += delta;
        else if (_label[b] == kT)
            _duals.blossom(b) -= delta;
    }

    switch (kind) {
        case DeltaKind::kVertexDual:
            // Optimum reached.
            return true;
        case DeltaKind::kFreeEdge:
        case DeltaKind::kSBlossomEdge: {
            // The least-slack edge is tight now; continue the search from its S endpoint.
            invariant(_label[_forest.topLevel(deltaEdge->from)] == kS);
            _allowed[deltaEdge->edge] = true;
            _queue.push_back(deltaEdge->from);
            return false;
        }
        case DeltaKind::kTBlossomDual:
            _expandBlossom(deltaBlossom, false);
            return false;
        case DeltaKind::kNone:
            break;
    }
    EDMONDS_UNREACHABLE;
}

template <typename W>
void MatchingSolver<W>::_expandZeroDualBlossoms() {
    for (BlossomId b : _forest.nonTrivialBlossoms()) {
        // Earlier expansions in this loop may have released or re-parented b.
        if (!_forest.isAllocated(b))
            continue;
        if (_forest.parent(b) == kNoBlossom && _label[b] == kS && _duals.blossom(b) == 0)
            _expandBlossom(b, true);
    }
}

template <typename W>
void MatchingSolver<W>::_assignLabel(VertexId w, Label t, const boost::optional<HalfEdge>& via) {
    const BlossomId b = _forest.topLevel(w);
    invariant(_label[w] == kFree && _label[b] == kFree);
    _label[w] = _label[b] = t;
    _labelEdge[w] = _labelEdge[b] = via;
    _bestEdge[w] = _bestEdge[b] = boost::none;
    if (t == kS) {
        _forest.forEachLeaf(b, [&](VertexId v) { _queue.push_back(v); });
    } else {
        // The base of a T-blossom is its only vertex with an external mate.
        const VertexId base = _forest.base(b);
        invariant(_mate[base] != kNoVertex);
        _assignLabel(_mate[base], kS, HalfEdge{base, _mate[base], _mateEdge[base]});
    }
}

template <typename W>
VertexId MatchingSolver<W>::_scanBlossom(VertexId v, VertexId w) {
    // Trace back from v and w in lock-step, leaving breadcrumbs, until the paths meet or both
    // reach a root.
    std::vector<BlossomId> path;
    VertexId base = kNoVertex;
    while (v != kNoVertex) {
        BlossomId b = _forest.topLevel(v);
        if (_label[b] & kBreadcrumb) {
            base = _forest.base(b);
            break;
        }
        invariant(_label[b] == kS);
        path.push_back(b);
        _label[b] = kS | kBreadcrumb;
        if (!_labelEdge[b]) {
            // The base of b is exposed: this is a tree root.
            invariant(_mate[_forest.base(b)] == kNoVertex);
            v = kNoVertex;
        } else {
            invariant(_labelEdge[b]->from == _mate[_forest.base(b)]);
            v = _labelEdge[b]->from;
            b = _forest.topLevel(v);
            invariant(_label[b] == kT);
            v = _labelEdge[b]->from;
        }
        if (w != kNoVertex)
            std::swap(v, w);
    }
    for (BlossomId b : path)
        _label[b] = kS;
    return base;
}

template <typename W>
void MatchingSolver<W>::_addBlossom(VertexId base, const HalfEdge& vw) {
    VertexId v = vw.from;
    VertexId w = vw.to;
    const BlossomId bb = _forest.topLevel(base);
    BlossomId bv = _forest.topLevel(v);
    BlossomId bw = _forest.topLevel(w);

    const BlossomId b = _forest.allocate();
    _forest.setBase(b, base);
    _forest.setParent(b, kNoBlossom);
    _forest.setParent(bb, b);

    auto& children = _forest.children(b);
    auto& edges = _forest.edges(b);
    edges.push_back(vw);

    // Trace back from v to the base.
    while (bv != bb) {
        _forest.setParent(bv, b);
        children.push_back(bv);
        invariant(_labelEdge[bv]);
        edges.push_back(*_labelEdge[bv]);
        invariant(_label[bv] == kT ||
                  (_label[bv] == kS && _labelEdge[bv]->from == _mate[_forest.base(bv)]));
        v = _labelEdge[bv]->from;
        bv = _forest.topLevel(v);
    }
    children.push_back(bb);
    std::reverse(children.begin(), children.end());
    std::reverse(edges.begin(), edges.end());

    // Trace back from w to the base.
    while (bw != bb) {
        _forest.setParent(bw, b);
        children.push_back(bw);
        invariant(_labelEdge[bw]);
        edges.push_back(_labelEdge[bw]->reversed());
        invariant(_label[bw] == kT ||
                  (_label[bw] == kS && _labelEdge[bw]->from == _mate[_forest.base(bw)]));
        w = _labelEdge[bw]->from;
        bw = _forest.topLevel(w);
    }

    invariant(_label[bb] == kS);
    _label[b] = kS;
    _labelEdge[b] = _labelEdge[bb];
    _duals.blossom(b) = W{0};

    // T-vertices of the cycle become S-vertices.
    _forest.forEachLeaf(b, [&](VertexId leaf) {
        if (_label[_forest.topLevel(leaf)] == kT)
            _queue.push_back(leaf);
        _forest.setTopLevel(leaf, b);
    });

    // Collect the least-slack edge from b to every neighboring S-blossom.
    std::vector<boost::optional<HalfEdge>> bestEdgeTo(2 * _n);
    std::vector<BlossomId> neighbors;
    auto consider = [&](const HalfEdge& k) {
        HalfEdge ij = _forest.topLevel(k.to) == b ? k.reversed() : k;
        const BlossomId bj = _forest.topLevel(ij.to);
        if (bj == b || _label[bj] != kS)
            return;
        if (!bestEdgeTo[bj]) {
            neighbors.push_back(bj);
            bestEdgeTo[bj] = ij;
        } else if (_slack(ij) < _slack(*bestEdgeTo[bj])) {
            bestEdgeTo[bj] = ij;
        }
    };
    auto scanVertex = [&](VertexId leaf) {
        for (EdgeId e : _graph.adjacency[leaf])
            consider(HalfEdge{leaf, _graph.other(e, leaf), e});
    };
    for (BlossomId child : children) {
        if (!_forest.isVertex(child) && _blossomBestEdges[child]) {
            for (const HalfEdge& k : *_blossomBestEdges[child])
                consider(k);
            // The sub-blossom won't need its list again.
            _blossomBestEdges[child] = boost::none;
        } else {
            _forest.forEachLeaf(child, scanVertex);
        }
        _bestEdge[child] = boost::none;
    }

    std::vector<HalfEdge> best;
    best.reserve(neighbors.size());
    for (BlossomId bj : neighbors)
        best.push_back(*bestEdgeTo[bj]);

    _bestEdge[b] = boost::none;
    for (const HalfEdge& k : best) {
        if (!_bestEdge[b] || _slack(k) < _slack(*_bestEdge[b]))
            _bestEdge[b] = k;
    }
    _blossomBestEdges[b] = std::move(best);

    LOGV2_DEBUG(7100105,
                4,
                "Contracted blossom",
                "blossom"_attr = b,
                "base"_attr = base,
                "children"_attr = children.size());
}

template <typename W>
void MatchingSolver<W>::_expandBlossom(BlossomId b, bool endStage) {
    LOGV2_DEBUG(7100106,
                4,
                "Expanding blossom",
                "blossom"_attr = b,
                "endStage"_attr = endStage,
                "dual"_attr = _duals.blossom(b));

    // Copies: recursive expansion releases and may reuse slots.
    const std::vector<BlossomId> children = _forest.children(b);
    const std::vector<HalfEdge> edges = _forest.edges(b);

    // Make the children top-level.
    for (BlossomId s : children) {
        _forest.setParent(s, kNoBlossom);
        if (_forest.isVertex(s)) {
            _forest.setTopLevel(s, s);
        } else if (endStage && _duals.blossom(s) == 0) {
            _expandBlossom(s, endStage);
        } else {
            _forest.forEachLeaf(s, [&](VertexId v) { _forest.setTopLevel(v, s); });
        }
    }

    // A T-blossom expanded mid-stage hands its label over to the children on the even-length
    // path from the entry child to the base.
    if (!endStage && _label[b] == kT) {
        invariant(_labelEdge[b]);
        const std::size_t size = children.size();
        const BlossomId entryChild = _forest.topLevel(_labelEdge[b]->to);
        long j = static_cast<long>(std::find(children.begin(), children.end(), entryChild) -
                                   children.begin());
        invariant(j < static_cast<long>(size));
        long jstep;
        if (j & 1) {
            // Odd start: go forward and wrap.
            j -= static_cast<long>(size);
            jstep = 1;
        } else {
            // Even start: go backward.
            jstep = -1;
        }

        HalfEdge vw = *_labelEdge[b];
        while (j != 0) {
            // Relabel the T-sub-blossom.
            HalfEdge pq = jstep == 1 ? edges[_wrap(j, size)] : edges[_wrap(j - 1, size)].reversed();
            _label[vw.to] = kFree;
            _label[pq.to] = kFree;
            _assignLabel(vw.to, kT, vw);
            // Step to the next S-sub-blossom and note its forward edge.
            _allowed[pq.edge] = true;
            j += jstep;
            vw = jstep == 1 ? edges[_wrap(j, size)] : edges[_wrap(j - 1, size)].reversed();
            // Step to the next T-sub-blossom.
            _allowed[vw.edge] = true;
            j += jstep;
        }

        // Relabel the base T-sub-blossom without stepping through to its mate.
        const BlossomId bw = children[_wrap(j, size)];
        _label[vw.to] = _label[bw] = kT;
        _labelEdge[vw.to] = _labelEdge[bw] = vw;
        _bestEdge[bw] = boost::none;

        // Continue round the cycle back to the entry child. Sub-blossoms reachable from an
        // S-vertex outside the expanded blossom get label T.
        j += jstep;
        while (children[_wrap(j, size)] != entryChild) {
            const BlossomId bv = children[_wrap(j, size)];
            j += jstep;
            if (_label[bv] == kS)
                continue;  // labeled S through one of its neighbors meanwhile

            VertexId reached = kNoVertex;
            _forest.forEachLeaf(bv, [&](VertexId v) {
                if (reached == kNoVertex && _label[v] != kFree)
                    reached = v;
            });
            if (reached == kNoVertex)
                continue;

            invariant(_label[reached] == kT);
            invariant(_forest.topLevel(reached) == bv);
            const HalfEdge via = *_labelEdge[reached];
            _label[reached] = kFree;
            _label[_mate[_forest.base(bv)]] = kFree;
            _assignLabel(reached, kT, via);
        }
    }

    _label[b] = kFree;
    _labelEdge[b] = boost::none;
    _bestEdge[b] = boost::none;
    _blossomBestEdges[b] = boost::none;
    _duals.blossom(b) = W{0};
    _forest.release(b);
}

template <typename W>
void MatchingSolver<W>::_augmentBlossom(BlossomId b, VertexId v) {
    // Find the child of b containing v and augment inside it first.
    BlossomId t = v;
    while (_forest.parent(t) != b)
        t = _forest.parent(t);
    if (!_forest.isVertex(t))
        _augmentBlossom(t, v);

    const auto& children = _forest.children(b);
    const auto& edges = _forest.edges(b);
    const std::size_t size = children.size();
    const std::size_t i = _forest.childIndex(b, t);
    long j = static_cast<long>(i);
    long jstep;
    if (i & 1) {
        // Odd start: go forward and wrap.
        j -= static_cast<long>(size);
        jstep = 1;
    } else {
        // Even start: go backward.
        jstep = -1;
    }

    // Walk to the base, matching every second connecting edge.
    while (j != 0) {
        j += jstep;
        t = children[_wrap(j, size)];
        const HalfEdge wx =
            jstep == 1 ? edges[_wrap(j, size)] : edges[_wrap(j - 1, size)].reversed();
        if (!_forest.isVertex(t))
            _augmentBlossom(t, wx.from);
        j += jstep;
        t = children[_wrap(j, size)];
        if (!_forest.isVertex(t))
            _augmentBlossom(t, wx.to);
        _match(wx.from, wx.to, wx.edge);
    }

    // The child holding v becomes the first child; v is the new base.
    _forest.rotate(b, i);
    _forest.setBase(b, _forest.base(_forest.children(b)[0]));
    invariant(_forest.base(b) == v);
}

template <typename W>
void MatchingSolver<W>::_augmentMatching(const HalfEdge& vw) {
    LOGV2_DEBUG(7100107,
                3,
                "Augmenting path found",
                "stage"_attr = _stages,
                "v"_attr = vw.from,
                "w"_attr = vw.to);

    for (const HalfEdge& start : {vw, vw.reversed()}) {
        // Match s to j, then trace back from s to the root of its tree, flipping matched and
        // unmatched edges on the way.
        VertexId s = start.from;
        VertexId j = start.to;
        EdgeId e = start.edge;
        while (true) {
            const BlossomId bs = _forest.topLevel(s);
            invariant(_label[bs] == kS);
            invariant((!_labelEdge[bs] && _mate[_forest.base(bs)] == kNoVertex) ||
                      (_labelEdge[bs] && _labelEdge[bs]->from == _mate[_forest.base(bs)]));
            if (!_forest.isVertex(bs))
                _augmentBlossom(bs, s);
            _mate[s] = j;
            _mateEdge[s] = e;

            if (!_labelEdge[bs])
                break;  // reached an exposed root

            const VertexId t = _labelEdge[bs]->from;
            const BlossomId bt = _forest.topLevel(t);
            invariant(_label[bt] == kT);
            invariant(_labelEdge[bt]);
            const HalfEdge next = *_labelEdge[bt];
            s = next.from;
            j = next.to;
            e = next.edge;
            invariant(_forest.base(bt) == t);
            if (!_forest.isVertex(bt))
                _augmentBlossom(bt, j);
            _mate[j] = s;
            _mateEdge[j] = e;
        }
    }
}

template <typename W>
void MatchingSolver<W>::_match(VertexId v, VertexId w, EdgeId e) {
    _mate[v] = w;
    _mate[w] = v;
    _mateEdge[v] = _mateEdge[w] = e;
}

template <typename W>
DualCertificate<W> MatchingSolver<W>::certificate() const {
    DualCertificate<W> c;
    c.numVertices = _n;
    c.maxCardinality = _maxCardinality;
    c.edges = _graph.edges;
    c.mate = _mate;
    c.vertexDual = _duals.vertexDuals();
    c.blossomDual = _duals.blossomDuals();
    c.parent.resize(2 * _n, kNoBlossom);
    c.blossomEdges.resize(2 * _n);
    for (BlossomId b = 0; b < 2 * _n; ++b) {
        if (_forest.isAllocated(b))
            c.parent[b] = _forest.parent(b);
        if (!_forest.isVertex(b) && _forest.isAllocated(b))
            c.blossomEdges[b] = _forest.edges(b);
    }
    return c;
}

template class MatchingSolver<std::int64_t>;
template class MatchingSolver<double>;

}  // namespace edmonds
