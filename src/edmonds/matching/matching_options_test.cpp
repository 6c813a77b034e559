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

#include <limits>

#include "edmonds/matching/matching_options.h"
#include "edmonds/unittest/unittest.h"

namespace edmonds {
namespace {

TEST(MatchingOptionsTest, DefaultsAreValid) {
    MatchingOptions options;
    ASSERT_FALSE(options.maxCardinality);
    ASSERT_EQUALS(options.weightAttribute, "weight");
    ASSERT(options.weightMode == WeightMode::kReal);
    ASSERT_EQUALS(options.epsilon, 0.0);
    ASSERT(options.verifyOptimum);
    ASSERT_OK(options.validate());
}

TEST(MatchingOptionsTest, RejectsBadEpsilon) {
    MatchingOptions options;
    options.epsilon = -1e-9;
    ASSERT_EQUALS(options.validate(), ErrorCodes::BadValue);
    options.epsilon = std::numeric_limits<double>::quiet_NaN();
    ASSERT_EQUALS(options.validate(), ErrorCodes::BadValue);
    options.epsilon = std::numeric_limits<double>::infinity();
    ASSERT_EQUALS(options.validate(), ErrorCodes::BadValue);
    options.epsilon = 1e-6;
    ASSERT_OK(options.validate());
}

TEST(MatchingOptionsTest, RejectsEmptyWeightAttribute) {
    MatchingOptions options;
    options.weightAttribute = "";
    ASSERT_EQUALS(options.validate(), ErrorCodes::BadValue);
}

TEST(MatchingOptionsTest, WeightModeNames) {
    ASSERT_EQUALS(toString(WeightMode::kReal), "real");
    ASSERT_EQUALS(toString(WeightMode::kInteger), "integer");
}

}  // namespace
}  // namespace edmonds
