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

#include "edmonds/base/status.h"
#include "edmonds/matching/indexed_graph.h"

namespace edmonds {

/**
 * Id of a vertex or blossom in a BlossomForest. Ids [0, n) are the vertices themselves
 * (trivial blossoms); ids [n, 2n) are slots for non-trivial blossoms.
 */
using BlossomId = int;

constexpr BlossomId kNoBlossom = -1;

/**
 * An edge seen from one of its endpoints.
 */
struct HalfEdge {
    VertexId from;
    VertexId to;
    EdgeId edge;

    HalfEdge reversed() const {
        return {to, from, edge};
    }

    bool operator==(const HalfEdge& other) const {
        return from == other.from && to == other.to && edge == other.edge;
    }
};

/**
 * The nesting structure of blossoms.
 *
 * A non-trivial blossom b owns an odd cycle of children, children(b)[0] being the child that
 * holds the base vertex, and a parallel list of connecting edges: edges(b)[i] goes from a
 * vertex in children(b)[i] to a vertex in children(b)[(i + 1) % k]. There can never be more
 * than n / 2 non-trivial blossoms at once, so n slots suffice. Released slots are reused
 * lowest id first.
 */
class BlossomForest {
public:
    explicit BlossomForest(int numVertices);

    int numVertices() const {
        return _n;
    }

    bool isVertex(BlossomId b) const {
        return b < _n;
    }

    bool isAllocated(BlossomId b) const {
        return isVertex(b) || _allocated[b - _n];
    }

    /**
     * Takes a free slot for a new non-trivial blossom. The slot has no parent, children or
     * edges.
     */
    BlossomId allocate();

    /**
     * Returns `b` to the free list, clearing its structure.
     */
    void release(BlossomId b);

    BlossomId parent(BlossomId b) const {
        return _parent[b];
    }

    void setParent(BlossomId b, BlossomId parent) {
        _parent[b] = parent;
    }

    /**
     * The base vertex of `b`; `b` itself for a vertex.
     */
    VertexId base(BlossomId b) const {
        return _base[b];
    }

    void setBase(BlossomId b, VertexId v) {
        _base[b] = v;
    }

    /**
     * The top-level blossom containing vertex `v`.
     */
    BlossomId topLevel(VertexId v) const {
        return _inBlossom[v];
    }

    void setTopLevel(VertexId v, BlossomId b) {
        _inBlossom[v] = b;
    }

    std::vector<BlossomId>& children(BlossomId b) {
        return _children[b];
    }

    const std::vector<BlossomId>& children(BlossomId b) const {
        return _children[b];
    }

    std::vector<HalfEdge>& edges(BlossomId b) {
        return _edges[b];
    }

    const std::vector<HalfEdge>& edges(BlossomId b) const {
        return _edges[b];
    }

    /**
     * Calls f(v) for every vertex contained in `b`, in child order.
     */
    template <typename F>
    void forEachLeaf(BlossomId b, F&& f) const {
        if (isVertex(b)) {
            f(static_cast<VertexId>(b));
            return;
        }
        for (BlossomId child : _children[b])
            forEachLeaf(child, f);
    }

    std::vector<VertexId> leaves(BlossomId b) const;

    /**
     * Position of `child` in children(b). `child` must be a child of `b`.
     */
    std::size_t childIndex(BlossomId b, BlossomId child) const;

    /**
     * Rotates the children and edges of `b` left by `i` so that children(b)[i] becomes the
     * first child.
     */
    void rotate(BlossomId b, std::size_t i);

    /**
     * Allocated non-trivial blossoms in increasing id order.
     */
    std::vector<BlossomId> nonTrivialBlossoms() const;

    /**
     * Checks the structural invariants: every vertex's top-level blossom is an allocated
     * top-level ancestor of it, and every non-trivial blossom has an odd number (at least
     * three) of children with as many edges. Returns InternalError naming the first
     * violation.
     */
    Status checkConsistency() const;

private:
    int _n;

    std::vector<BlossomId> _parent;
    std::vector<VertexId> _base;
    std::vector<BlossomId> _inBlossom;
    std::vector<std::vector<BlossomId>> _children;
    std::vector<std::vector<HalfEdge>> _edges;

    std::vector<bool> _allocated;
    std::vector<BlossomId> _free;
};

}  // namespace edmonds
