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

#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include "edmonds/logv2/log_manager.h"

namespace po = boost::program_options;

int main(int argc, char** argv) {
    // GoogleTest removes the flags it understands (--gtest_filter and friends) from argv.
    ::testing::InitGoogleTest(&argc, argv);

    po::options_description options("Unit test options");
    // clang-format off
    options.add_options()
        ("help,h", "produce help message")
        ("verbose,v", "be more verbose (include multiple times for more verbosity e.g. -vvvvv)");
    // clang-format on

    po::options_description hidden("hidden options");
    // support for -vv -vvvv etc.
    for (std::string s = "vv"; s.length() <= 5; s.append("v")) {
        hidden.add_options()(s.c_str(), "verbose");
    }

    const int style = (((po::command_line_style::unix_style ^
                         po::command_line_style::allow_guessing) |
                        po::command_line_style::allow_long_disguise) ^
                       po::command_line_style::allow_sticky);

    po::variables_map environment;
    try {
        po::options_description all("all options");
        all.add(options).add(hidden);
        po::store(po::command_line_parser(argc, argv).options(all).style(style).run(),
                  environment);
        po::notify(environment);
    } catch (const po::error& ex) {
        std::cerr << "error parsing command line: " << ex.what() << std::endl;
        std::cerr << options << std::endl;
        return EXIT_FAILURE;
    }

    if (environment.count("help")) {
        std::cout << options << std::endl;
        return EXIT_SUCCESS;
    }

    int verbosity = environment.count("verbose") ? 1 : 0;
    for (std::string s = "vv"; s.length() <= 5; s.append("v")) {
        if (environment.count(s))
            verbosity = s.length();
    }
    ::edmonds::logv2::LogManager::global().setMinimumSeverity(
        ::edmonds::logv2::LogSeverity::Debug(verbosity));

    return RUN_ALL_TESTS();
}
