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

#include <string>
#include <vector>

#include "edmonds/logv2/log_manager.h"
#include "edmonds/tools/tool.h"
#include "edmonds/unittest/unittest.h"
#include "edmonds/util/assert_util.h"

namespace po = boost::program_options;

namespace edmonds {
namespace tools {
namespace {

class EchoTool : public Tool {
public:
    EchoTool() : Tool("echo_tool") {
        addOptions()("count", po::value<int>()->default_value(1), "repetitions");
        addHiddenOptions()("input", po::value<std::string>(), "input");
        addPositionArg("input", 1);
    }

    int run() override {
        ++runs;
        if (getParam("input") == "fail")
            uasserted(ErrorCodes::BadValue, "asked to fail");
        return EXIT_CLEAN;
    }

    int verbosity() const {
        return _verbosity;
    }

    int runs = 0;
};

class ToolTest : public unittest::Test {
protected:
    void tearDown() override {
        logv2::LogManager::global().setMinimumSeverity(_savedSeverity);
    }

    int runTool(EchoTool& tool, std::vector<std::string> args) {
        args.insert(args.begin(), "echo_tool");
        std::vector<char*> argv;
        for (auto& arg : args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);
        return tool.main(static_cast<int>(args.size()), argv.data());
    }

private:
    logv2::LogSeverity _savedSeverity = logv2::LogManager::global().getMinimumSeverity();
};

TEST_F(ToolTest, RunsWithPositionalArgument) {
    EchoTool tool;
    ASSERT_EQUALS(runTool(tool, {"data.txt", "--count", "3"}), EXIT_CLEAN);
    ASSERT_EQUALS(tool.runs, 1);
    ASSERT_EQUALS(tool.getParam("input"), "data.txt");
    ASSERT_EQUALS(tool.getParamAs<int>("count"), 3);
    ASSERT_FALSE(tool.hasParam("missing"));
    ASSERT_EQUALS(tool.getParam("missing", "fallback"), "fallback");
}

TEST_F(ToolTest, HelpSkipsRun) {
    EchoTool tool;
    ASSERT_EQUALS(runTool(tool, {"--help"}), EXIT_CLEAN);
    ASSERT_EQUALS(tool.runs, 0);
}

TEST_F(ToolTest, UnknownOptionIsBadOptions) {
    EchoTool tool;
    ASSERT_EQUALS(runTool(tool, {"--no-such-option"}), EXIT_BADOPTIONS);
    ASSERT_EQUALS(tool.runs, 0);
}

TEST_F(ToolTest, BadValueIsBadOptions) {
    EchoTool tool;
    ASSERT_EQUALS(runTool(tool, {"--count", "many"}), EXIT_BADOPTIONS);
}

TEST_F(ToolTest, VerbosityFlags) {
    EchoTool plain;
    ASSERT_EQUALS(runTool(plain, {}), EXIT_CLEAN);
    ASSERT_EQUALS(plain.verbosity(), 0);

    EchoTool single;
    ASSERT_EQUALS(runTool(single, {"-v"}), EXIT_CLEAN);
    ASSERT_EQUALS(single.verbosity(), 1);

    EchoTool triple;
    ASSERT_EQUALS(runTool(triple, {"-vvv"}), EXIT_CLEAN);
    ASSERT_EQUALS(triple.verbosity(), 3);
    ASSERT(logv2::LogManager::global().getMinimumSeverity() == logv2::LogSeverity::Debug(3));
}

TEST_F(ToolTest, AssertionInRunIsError) {
    EchoTool tool;
    ASSERT_EQUALS(runTool(tool, {"fail"}), EXIT_ERROR);
    ASSERT_EQUALS(tool.runs, 1);
}

}  // namespace
}  // namespace tools
}  // namespace edmonds
