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

#include "edmonds/matching/max_weight_matching.h"

#include <type_traits>

#include "edmonds/logv2/log.h"
#include "edmonds/matching/matching_solver.h"
#include "edmonds/matching/optimality_verifier.h"

namespace edmonds {
namespace matching_detail {

namespace {

template <typename W>
std::vector<VertexId> solve(const IndexedGraph<W>& graph,
                            const MatchingOptions& options,
                            W epsilon) {
    MatchingSolver<W> solver(graph, options.maxCardinality, epsilon);
    solver.solve();

    if constexpr (std::is_integral_v<W>) {
        if (options.verifyOptimum) {
            Status status = verifyOptimality(solver.certificate());
            if (!status.isOK()) {
                LOGV2_ERROR(7100111,
                            "Matching failed the optimality check",
                            "vertices"_attr = graph.numVertices,
                            "edges"_attr = graph.edges.size(),
                            "error"_attr = status);
                massertStatusOK(status);
            }
        }
    }

    LOGV2_DEBUG(7100112,
                2,
                "Computed matching in {stages} stages",
                "stages"_attr = solver.stages(),
                "weightMode"_attr = toString(options.weightMode),
                "maxCardinality"_attr = options.maxCardinality);
    return solver.mates();
}

}  // namespace

std::vector<VertexId> computeMates(const IndexedGraph<std::int64_t>& graph,
                                   const MatchingOptions& options) {
    return solve<std::int64_t>(graph, options, 0);
}

std::vector<VertexId> computeMates(const IndexedGraph<double>& graph,
                                   const MatchingOptions& options) {
    if (!graph.allInteger && options.epsilon == 0) {
        LOGV2_DEBUG(7100113,
                    3,
                    "Solving fractional weights with exact zero-slack tests",
                    "edges"_attr = graph.edges.size());
    }
    return solve<double>(graph, options, options.epsilon);
}

}  // namespace matching_detail
}  // namespace edmonds
