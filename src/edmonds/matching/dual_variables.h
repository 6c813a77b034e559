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
#include <vector>

#include "edmonds/matching/blossom_forest.h"
#include "edmonds/matching/indexed_graph.h"

namespace edmonds {

/**
 * Dual variables of the matching linear program.
 *
 * vertex(v) holds 2 * u(v), so that integer weights keep every dual and slack integral.
 * blossom(b) holds z(b) for a non-trivial blossom b.
 */
template <typename W>
class DualVariables {
public:
    DualVariables(int numVertices, W initialVertexDual)
        : _vertex(numVertices, initialVertexDual), _blossom(2 * numVertices, W{0}) {}

    W& vertex(VertexId v) {
        return _vertex[v];
    }

    W vertex(VertexId v) const {
        return _vertex[v];
    }

    W& blossom(BlossomId b) {
        return _blossom[b];
    }

    W blossom(BlossomId b) const {
        return _blossom[b];
    }

    /**
     * Twice the slack of an edge whose endpoints lie in different top-level blossoms.
     */
    W slack(const typename IndexedGraph<W>::Edge& e) const {
        return _vertex[e.u] + _vertex[e.v] - 2 * e.weight;
    }

    W minVertexDual() const {
        return *std::min_element(_vertex.begin(), _vertex.end());
    }

    const std::vector<W>& vertexDuals() const {
        return _vertex;
    }

    const std::vector<W>& blossomDuals() const {
        return _blossom;
    }

private:
    std::vector<W> _vertex;
    std::vector<W> _blossom;
};

}  // namespace edmonds
