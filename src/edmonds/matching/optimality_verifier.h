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

#include "edmonds/base/status.h"
#include "edmonds/matching/blossom_forest.h"
#include "edmonds/matching/indexed_graph.h"

namespace edmonds {

/**
 * A matching together with the dual solution that proves it optimal.
 *
 * parent, blossomDual and blossomEdges are indexed by BlossomId (size 2 * numVertices);
 * blossomEdges is empty for vertices and for unused blossom slots.
 */
template <typename W>
struct DualCertificate {
    int numVertices = 0;
    bool maxCardinality = false;
    std::vector<typename IndexedGraph<W>::Edge> edges;
    std::vector<VertexId> mate;
    std::vector<W> vertexDual;
    std::vector<BlossomId> parent;
    std::vector<W> blossomDual;
    std::vector<std::vector<HalfEdge>> blossomEdges;
};

/**
 * Checks that `certificate` proves its matching to be of maximum weight (of maximum weight
 * among maximum-cardinality matchings if maxCardinality is set):
 *
 *  - the mate relation is symmetric and every matched pair is joined by an edge;
 *  - all blossom duals, and all vertex duals after a uniform non-negative offset, are >= 0;
 *  - every edge has non-negative slack and every matched edge has zero slack;
 *  - every exposed vertex has zero dual;
 *  - every blossom with positive dual is full: every other connecting edge is matched.
 *
 * Returns MatchingNotOptimal describing the first violated condition.
 */
Status verifyOptimality(const DualCertificate<std::int64_t>& certificate);

}  // namespace edmonds
