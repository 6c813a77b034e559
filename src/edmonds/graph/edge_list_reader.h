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

#include <iosfwd>
#include <string>

#include <boost/optional.hpp>

#include "edmonds/base/status_with.h"
#include "edmonds/graph/graph.h"

namespace edmonds {

struct EdgeListOptions {
    // Field separator. Runs of whitespace separate fields when unset.
    boost::optional<char> delimiter;

    // Everything from this marker to the end of a line is ignored. Empty disables comments.
    std::string comments = "#";

    // Attribute that receives the optional third field.
    std::string weightAttribute = "weight";

    GraphKind kind = GraphKind::kGraph;
};

/**
 * Reads a weighted edge list, one edge per line:
 *
 *     # comment
 *     u v 3.5
 *     v w        # no weight: the edge carries no weight attribute
 *
 * Blank and comment-only lines are skipped. Any other line must have two or three fields, and
 * a third field must parse as a number. Malformed input is reported as FailedToParse naming the
 * offending line.
 */
StatusWith<BasicGraph<std::string>> readEdgeList(std::istream& in,
                                                 const EdgeListOptions& options = {});

/**
 * Reads an edge list from `path`, or from standard input if `path` is "-".
 * Returns FileNotOpen if the file cannot be read.
 */
StatusWith<BasicGraph<std::string>> readEdgeListFile(const std::string& path,
                                                     const EdgeListOptions& options = {});

}  // namespace edmonds
