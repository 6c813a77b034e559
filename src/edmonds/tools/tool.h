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
#include <memory>
#include <string>

#include <boost/program_options.hpp>

namespace edmonds {
namespace tools {

enum ExitCode : int {
    EXIT_CLEAN = 0,
    EXIT_ERROR = 1,
    EXIT_BADOPTIONS = 2,
};

/**
 * Base class for command line tools. Subclasses register their options in the constructor and
 * implement run(); main() parses the command line, handles --help and -v, and turns uncaught
 * DBExceptions into an error exit.
 */
class Tool {
public:
    explicit Tool(std::string name);
    virtual ~Tool();

    Tool(const Tool&) = delete;
    Tool& operator=(const Tool&) = delete;

    int main(int argc, char** argv);

    boost::program_options::options_description_easy_init addOptions() {
        return _options->add_options();
    }

    boost::program_options::options_description_easy_init addHiddenOptions() {
        return _hiddenOptions->add_options();
    }

    void addPositionArg(const char* name, int pos) {
        _positionalOptions.add(name, pos);
    }

    std::string getParam(const std::string& name, const std::string& def = "") const {
        if (_params.count(name))
            return _params[name].as<std::string>();
        return def;
    }

    template <typename T>
    T getParamAs(const std::string& name) const {
        return _params[name].as<T>();
    }

    bool hasParam(const std::string& name) const {
        return _params.count(name) > 0;
    }

    virtual int run() = 0;

    virtual void printHelp(std::ostream& out);

    virtual void printExtraHelp(std::ostream& out) {}

protected:
    std::string _name;

    // Number of -v flags given.
    int _verbosity = 0;

private:
    std::unique_ptr<boost::program_options::options_description> _options;
    std::unique_ptr<boost::program_options::options_description> _hiddenOptions;
    boost::program_options::positional_options_description _positionalOptions;

    boost::program_options::variables_map _params;
};

}  // namespace tools
}  // namespace edmonds
