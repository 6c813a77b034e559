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

#define EDMONDS_LOGV2_DEFAULT_COMPONENT ::edmonds::logv2::LogComponent::kTool

#include "edmonds/tools/match_tool.h"

#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "edmonds/graph/edge_list_reader.h"
#include "edmonds/logv2/log.h"
#include "edmonds/matching/matching_util.h"
#include "edmonds/matching/max_weight_matching.h"
#include "edmonds/util/assert_util.h"

namespace po = boost::program_options;

namespace edmonds {
namespace tools {

MatchTool::MatchTool() : MatchTool(std::cout) {}

MatchTool::MatchTool(std::ostream& out) : Tool("edmonds_match"), _out(out) {
    // clang-format off
    addOptions()
        ("file", po::value<std::string>()->default_value("-"),
         "edge list to read, - for standard input")
        ("max-cardinality", "only consider matchings of maximum cardinality")
        ("min-weight", "find a minimum-weight matching among those of maximum cardinality")
        ("integer-weights", "require integer weights and verify the result")
        ("no-verify", "skip the optimality check done with --integer-weights")
        ("epsilon", po::value<double>()->default_value(0.0),
         "treat edges with slack up to this value as tight")
        ("weight-key", po::value<std::string>()->default_value("weight"),
         "name of the weight attribute")
        ("delimiter", po::value<std::string>(),
         "single character separating fields (default: whitespace)")
        ("comments", po::value<std::string>()->default_value("#"),
         "marker starting a comment");
    // clang-format on
    addPositionArg("file", 1);
}

void MatchTool::printExtraHelp(std::ostream& out) {
    out << "Computes a maximum-weight matching of a weighted edge list.\n\n"
        << "usage: " << _name << " [options] [file]\n\n"
        << "Input lines are \"u v [weight]\". Each matched pair is printed on its own line,\n"
        << "followed by a summary comment.\n"
        << std::endl;
}

int MatchTool::run() {
    EdgeListOptions listOptions;
    listOptions.comments = getParam("comments");
    listOptions.weightAttribute = getParam("weight-key");
    if (hasParam("delimiter")) {
        const std::string delimiter = getParam("delimiter");
        if (delimiter.size() != 1) {
            std::cerr << "ERROR: --delimiter must be a single character" << std::endl;
            return EXIT_BADOPTIONS;
        }
        listOptions.delimiter = delimiter[0];
    }

    MatchingOptions options;
    options.maxCardinality = hasParam("max-cardinality");
    options.weightAttribute = listOptions.weightAttribute;
    options.weightMode =
        hasParam("integer-weights") ? WeightMode::kInteger : WeightMode::kReal;
    options.epsilon = getParamAs<double>("epsilon");
    options.verifyOptimum = !hasParam("no-verify");
    Status valid = options.validate();
    if (!valid.isOK()) {
        std::cerr << "ERROR: " << valid.reason() << std::endl;
        return EXIT_BADOPTIONS;
    }

    const std::string path = getParam("file");
    auto graph = uassertStatusOK(readEdgeListFile(path, listOptions));
    LOGV2_DEBUG(7100402,
                1,
                "Read edge list",
                "file"_attr = path,
                "nodes"_attr = graph.numberOfNodes(),
                "edges"_attr = graph.numberOfEdges());

    const bool minWeight = hasParam("min-weight");
    const auto matching =
        minWeight ? minWeightMatching(graph, options) : maxWeightMatching(graph, options);
    const double weight = matchingWeight(graph, matching, options.weightAttribute);

    for (const auto& [u, v] : matching)
        _out << u << ' ' << v << '\n';
    _out << "# pairs: " << matching.size() << " weight: " << weight << std::endl;

    LOGV2_DEBUG(7100403,
                1,
                "Computed {objective} matching",
                "objective"_attr = minWeight ? "minimum-weight" : "maximum-weight",
                "pairs"_attr = matching.size(),
                "weight"_attr = weight,
                "weightMode"_attr = toString(options.weightMode),
                "verifyOptimum"_attr = options.verifyOptimum);
    return EXIT_CLEAN;
}

}  // namespace tools
}  // namespace edmonds
