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

#include "edmonds/tools/tool.h"

#include <iostream>
#include <utility>

#include "edmonds/logv2/log.h"
#include "edmonds/logv2/log_manager.h"
#include "edmonds/util/assert_util.h"

namespace po = boost::program_options;

namespace edmonds {
namespace tools {

Tool::Tool(std::string name)
    : _name(std::move(name)),
      _options(std::make_unique<po::options_description>("options")),
      _hiddenOptions(std::make_unique<po::options_description>(_name + " hidden options")) {
    // clang-format off
    _options->add_options()
        ("help", "produce help message")
        ("verbose,v", "be more verbose (include multiple times for more verbosity e.g. -vvvvv)");
    // clang-format on

    // support for -vv -vvvv etc.
    for (std::string s = "vv"; s.length() <= 5; s.append("v")) {
        _hiddenOptions->add_options()(s.c_str(), "verbose");
    }
}

Tool::~Tool() = default;

void Tool::printHelp(std::ostream& out) {
    printExtraHelp(out);
    _options->print(out);
}

int Tool::main(int argc, char** argv) {
    if (argc > 0)
        _name = argv[0];

    // using the same style as the server binaries
    const int style = (((po::command_line_style::unix_style ^
                         po::command_line_style::allow_guessing) |
                        po::command_line_style::allow_long_disguise) ^
                       po::command_line_style::allow_sticky);
    try {
        po::options_description all("all options");
        all.add(*_options).add(*_hiddenOptions);

        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(_positionalOptions)
                      .style(style)
                      .run(),
                  _params);
        po::notify(_params);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        printHelp(std::cerr);
        return EXIT_BADOPTIONS;
    }

    if (_params.count("help")) {
        printHelp(std::cout);
        return EXIT_CLEAN;
    }

    if (_params.count("verbose"))
        _verbosity = 1;
    for (std::string s = "vv"; s.length() <= 5; s.append("v")) {
        if (_params.count(s))
            _verbosity = s.length();
    }
    logv2::LogManager::global().setMinimumSeverity(logv2::LogSeverity::Debug(_verbosity));

    try {
        return run();
    } catch (const DBException& e) {
        LOGV2_ERROR(7100401, "Tool failed", "tool"_attr = _name, "error"_attr = e.toStatus());
        std::cerr << "error: " << e.toString() << std::endl;
        return EXIT_ERROR;
    }
}

}  // namespace tools
}  // namespace edmonds
