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

#define EDMONDS_LOGV2_DEFAULT_COMPONENT ::edmonds::logv2::LogComponent::kGraph

#include "edmonds/graph/edge_list_reader.h"

#include <cmath>
#include <fstream>
#include <iostream>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "edmonds/logv2/log.h"
#include "edmonds/util/str.h"

namespace edmonds {

namespace {

std::vector<std::string> splitFields(const std::string& line, const EdgeListOptions& options) {
    std::vector<std::string> fields;
    if (options.delimiter) {
        boost::algorithm::split(
            fields, line, boost::algorithm::is_any_of(std::string(1, *options.delimiter)));
        for (auto& field : fields)
            boost::algorithm::trim(field);
    } else {
        std::string trimmed = boost::algorithm::trim_copy(line);
        if (trimmed.empty())
            return fields;
        boost::algorithm::split(fields,
                                trimmed,
                                boost::algorithm::is_space(),
                                boost::algorithm::token_compress_on);
    }
    return fields;
}

}  // namespace

StatusWith<BasicGraph<std::string>> readEdgeList(std::istream& in,
                                                 const EdgeListOptions& options) {
    BasicGraph<std::string> graph(options.kind);
    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (!options.comments.empty()) {
            auto pos = line.find(options.comments);
            if (pos != std::string::npos)
                line.erase(pos);
        }
        if (boost::algorithm::trim_copy(line).empty())
            continue;

        auto fields = splitFields(line, options);
        if (fields.size() < 2 || fields.size() > 3) {
            return {ErrorCodes::FailedToParse,
                    str::stream() << "line " << lineNumber << ": expected 'u v [weight]' but found "
                                  << fields.size() << " field(s)"};
        }
        if (fields[0].empty() || fields[1].empty()) {
            return {ErrorCodes::FailedToParse,
                    str::stream() << "line " << lineNumber << ": empty node name"};
        }

        if (fields.size() == 2) {
            graph.addEdge(fields[0], fields[1]);
            continue;
        }

        double weight;
        try {
            weight = boost::lexical_cast<double>(fields[2]);
        } catch (const boost::bad_lexical_cast&) {
            return {ErrorCodes::FailedToParse,
                    str::stream() << "line " << lineNumber << ": weight '" << fields[2]
                                  << "' is not a number"};
        }
        if (!std::isfinite(weight)) {
            return {ErrorCodes::FailedToParse,
                    str::stream() << "line " << lineNumber << ": weight '" << fields[2]
                                  << "' is not finite"};
        }
        graph.addWeightedEdge(fields[0], fields[1], weight, options.weightAttribute);
    }

    if (in.bad()) {
        return {ErrorCodes::FileNotOpen,
                str::stream() << "read error after line " << lineNumber};
    }

    LOGV2_DEBUG(7100301,
                1,
                "Read edge list",
                "lines"_attr = lineNumber,
                "nodes"_attr = graph.numberOfNodes(),
                "edges"_attr = graph.numberOfEdges());
    return graph;
}

StatusWith<BasicGraph<std::string>> readEdgeListFile(const std::string& path,
                                                     const EdgeListOptions& options) {
    if (path == "-")
        return readEdgeList(std::cin, options);

    std::ifstream in(path);
    if (!in) {
        return {ErrorCodes::FileNotOpen, str::stream() << "couldn't open file " << path};
    }
    auto swGraph = readEdgeList(in, options);
    if (!swGraph.isOK())
        return swGraph.getStatus().withContext(str::stream() << "error reading " << path);
    return swGraph;
}

}  // namespace edmonds
