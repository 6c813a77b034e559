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

#include "edmonds/base/error_codes.h"

#include <ostream>

namespace edmonds {

std::string ErrorCodes::errorString(Error err) {
    switch (err) {
        case OK:
            return "OK";
        case InternalError:
            return "InternalError";
        case BadValue:
            return "BadValue";
        case NoSuchKey:
            return "NoSuchKey";
        case UnknownError:
            return "UnknownError";
        case FailedToParse:
            return "FailedToParse";
        case FileNotOpen:
            return "FileNotOpen";
        case GraphKindNotSupported:
            return "GraphKindNotSupported";
        case MatchingNotOptimal:
            return "MatchingNotOptimal";
        default:
            return "Location" + std::to_string(int(err));
    }
}

ErrorCodes::Error ErrorCodes::fromString(const std::string& name) {
    if (name == "OK")
        return OK;
    if (name == "InternalError")
        return InternalError;
    if (name == "BadValue")
        return BadValue;
    if (name == "NoSuchKey")
        return NoSuchKey;
    if (name == "FailedToParse")
        return FailedToParse;
    if (name == "FileNotOpen")
        return FileNotOpen;
    if (name == "GraphKindNotSupported")
        return GraphKindNotSupported;
    if (name == "MatchingNotOptimal")
        return MatchingNotOptimal;
    return UnknownError;
}

bool ErrorCodes::isInputError(Error err) {
    switch (err) {
        case BadValue:
        case FailedToParse:
        case GraphKindNotSupported:
            return true;
        default:
            return false;
    }
}

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code) {
    return stream << ErrorCodes::errorString(code);
}

}  // namespace edmonds
