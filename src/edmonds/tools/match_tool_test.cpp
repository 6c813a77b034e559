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

#include "edmonds/tools/match_tool.h"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "edmonds/logv2/log_manager.h"
#include "edmonds/unittest/unittest.h"

namespace edmonds {
namespace tools {
namespace {

class MatchToolTest : public unittest::Test {
protected:
    void setUp() override {
        logv2::LogManager::global().startCapturingLogMessages();
    }

    void tearDown() override {
        logv2::LogManager::global().stopCapturingLogMessages();
        logv2::LogManager::global().setMinimumSeverity(_savedSeverity);
    }

    std::string writeEdgeList(const std::string& name, const std::string& contents) {
        const std::string path = ::testing::TempDir() + "edmonds_match_" + name;
        std::ofstream file(path, std::ios::trunc);
        file << contents;
        return path;
    }

    int runTool(std::vector<std::string> args) {
        args.insert(args.begin(), "edmonds_match");
        std::vector<char*> argv;
        for (auto& arg : args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);
        MatchTool tool(_out);
        return tool.main(static_cast<int>(args.size()), argv.data());
    }

    std::string output() const {
        return _out.str();
    }

    const std::string kPath = "1 2 5\n2 3 11\n3 4 5\n";
    const std::string kSquare = "# square with two perfect matchings\n"
                                "1 2 1\n2 3 2\n3 4 1\n4 1 2\n";

private:
    std::ostringstream _out;
    logv2::LogSeverity _savedSeverity = logv2::LogManager::global().getMinimumSeverity();
};

TEST_F(MatchToolTest, PrintsPairsAndSummary) {
    const std::string path = writeEdgeList("path.txt", kPath);
    ASSERT_EQUALS(runTool({path}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "2 3\n# pairs: 1 weight: 11\n");
}

TEST_F(MatchToolTest, FileOption) {
    const std::string path = writeEdgeList("file_option.txt", kPath);
    ASSERT_EQUALS(runTool({"--file", path}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "2 3\n# pairs: 1 weight: 11\n");
}

TEST_F(MatchToolTest, MaxCardinality) {
    const std::string path = writeEdgeList("max_cardinality.txt", kPath);
    ASSERT_EQUALS(runTool({path, "--max-cardinality"}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "1 2\n3 4\n# pairs: 2 weight: 10\n");
}

TEST_F(MatchToolTest, MinWeight) {
    const std::string path = writeEdgeList("min_weight.txt", kSquare);
    ASSERT_EQUALS(runTool({path, "--min-weight"}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "1 2\n3 4\n# pairs: 2 weight: 2\n");
}

TEST_F(MatchToolTest, MaxWeightOfSquare) {
    const std::string path = writeEdgeList("square.txt", kSquare);
    ASSERT_EQUALS(runTool({path}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "1 4\n2 3\n# pairs: 2 weight: 4\n");
}

TEST_F(MatchToolTest, DelimiterAndWeightKey) {
    const std::string path = writeEdgeList("delimited.csv", "a,b,3\nb,c,4\n% skipped\nc,d,3\n");
    ASSERT_EQUALS(runTool({path, "--delimiter", ",", "--comments", "%", "--weight-key", "cost"}),
                  EXIT_CLEAN);
    ASSERT_EQUALS(output(), "a b\nc d\n# pairs: 2 weight: 6\n");
}

TEST_F(MatchToolTest, IntegerWeightsReachOptions) {
    const std::string path = writeEdgeList("integer.txt", kPath);
    ASSERT_EQUALS(runTool({path, "-v", "--integer-weights"}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "2 3\n# pairs: 1 weight: 11\n");
    auto& logs = logv2::LogManager::global();
    ASSERT_EQUALS(logs.countCapturedLogLinesContaining(R"("id":7100403)"), 1);
    ASSERT_EQUALS(logs.countCapturedLogLinesContaining(R"("weightMode":"integer")"), 1);
    ASSERT_EQUALS(logs.countCapturedLogLinesContaining(R"("verifyOptimum":true)"), 1);
}

TEST_F(MatchToolTest, NoVerifyReachesOptions) {
    const std::string path = writeEdgeList("no_verify.txt", kPath);
    ASSERT_EQUALS(runTool({path, "-v", "--integer-weights", "--no-verify"}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "2 3\n# pairs: 1 weight: 11\n");
    ASSERT_EQUALS(
        logv2::LogManager::global().countCapturedLogLinesContaining(R"("verifyOptimum":false)"),
        1);
}

TEST_F(MatchToolTest, IntegerWeightsRejectFractions) {
    const std::string path = writeEdgeList("fraction.txt", "1 2 2.5\n");
    ASSERT_EQUALS(runTool({path, "--integer-weights"}), EXIT_ERROR);
    ASSERT_EQUALS(output(), "");
}

TEST_F(MatchToolTest, MultiCharacterDelimiterIsBadOptions) {
    const std::string path = writeEdgeList("bad_delimiter.txt", kPath);
    ASSERT_EQUALS(runTool({path, "--delimiter", "::"}), EXIT_BADOPTIONS);
    ASSERT_EQUALS(output(), "");
}

TEST_F(MatchToolTest, NegativeEpsilonIsBadOptions) {
    const std::string path = writeEdgeList("bad_epsilon.txt", kPath);
    ASSERT_EQUALS(runTool({path, "--epsilon=-1"}), EXIT_BADOPTIONS);
    ASSERT_EQUALS(output(), "");
}

TEST_F(MatchToolTest, UnparsableEpsilonIsBadOptions) {
    const std::string path = writeEdgeList("word_epsilon.txt", kPath);
    ASSERT_EQUALS(runTool({path, "--epsilon", "small"}), EXIT_BADOPTIONS);
}

TEST_F(MatchToolTest, MissingFileIsError) {
    ASSERT_EQUALS(runTool({::testing::TempDir() + "edmonds_match_no_such_file.txt"}), EXIT_ERROR);
    ASSERT_EQUALS(output(), "");
}

TEST_F(MatchToolTest, MalformedLineIsError) {
    const std::string path = writeEdgeList("malformed.txt", "1 2 3 4\n");
    ASSERT_EQUALS(runTool({path}), EXIT_ERROR);
}

TEST_F(MatchToolTest, EmptyEdgeList) {
    const std::string path = writeEdgeList("empty.txt", "# nothing here\n");
    ASSERT_EQUALS(runTool({path}), EXIT_CLEAN);
    ASSERT_EQUALS(output(), "# pairs: 0 weight: 0\n");
}

}  // namespace
}  // namespace tools
}  // namespace edmonds
