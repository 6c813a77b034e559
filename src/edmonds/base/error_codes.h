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

#include <cstdint>
#include <iosfwd>
#include <string>

namespace edmonds {

/**
 * The table of error codes used by Status, StatusWith and the assertion macros.
 *
 *  # Error table
 *  [OK, 0]
 *  [InternalError, 1]
 *  [BadValue, 2]
 *  ...
 *
 *  # Error classes
 *  [InputError, [BadValue, FailedToParse, GraphKindNotSupported]]
 *
 * Codes above MaxError are allowed so that numeric assertion ids (the first argument of
 * uassert and massert) remain valid error codes.
 */
class ErrorCodes {
public:
    // Explicitly 32-bits wide so that non-symbolic values,
    // like uassert codes, are valid.
    enum Error : std::int32_t {
        OK = 0,
        InternalError = 1,
        BadValue = 2,
        NoSuchKey = 4,
        UnknownError = 8,
        FailedToParse = 9,
        FileNotOpen = 38,
        GraphKindNotSupported = 115,
        MatchingNotOptimal = 116,
        MaxError
    };

    static std::string errorString(Error err);

    /**
     * Parses an Error from its "name".  Returns UnknownError if "name" is unrecognized.
     *
     * NOTE: Also returns UnknownError for the string "UnknownError".
     */
    static Error fromString(const std::string& name);

    /**
     * Errors caused by the caller's input rather than by a defect in this library.
     */
    static bool isInputError(Error err);
};

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code);

}  // namespace edmonds
