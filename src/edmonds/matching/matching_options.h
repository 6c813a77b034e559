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

#include <string>

#include "edmonds/base/status.h"

namespace edmonds {

/**
 * Arithmetic used by the solver.
 *
 * kReal runs on double. kInteger requires every weight to be an exact integer in
 * [-2^50, 2^50], runs on std::int64_t, and makes the optimality verifier available.
 */
enum class WeightMode { kReal, kInteger };

std::string toString(WeightMode mode);

struct MatchingOptions {
    // Only consider matchings of maximum cardinality, and among those return one of maximum
    // weight.
    bool maxCardinality = false;

    // Edge attribute holding the weight. Edges without it weigh 1.
    std::string weightAttribute = "weight";

    WeightMode weightMode = WeightMode::kReal;

    // Edges whose (doubled) slack is at most epsilon are treated as tight. Only used in kReal
    // mode.
    double epsilon = 0.0;

    // Check the final primal/dual certificate. Only used in kInteger mode.
    bool verifyOptimum = true;

    /**
     * Returns BadValue for a negative or non-finite epsilon, or an empty weight attribute.
     */
    Status validate() const;
};

}  // namespace edmonds
