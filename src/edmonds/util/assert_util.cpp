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

#define EDMONDS_LOGV2_DEFAULT_COMPONENT ::edmonds::logv2::LogComponent::kDefault

#include "edmonds/util/assert_util.h"

#include <cstdlib>
#include <typeinfo>

#include "edmonds/logv2/log.h"
#include "edmonds/util/str.h"

namespace edmonds {

void invariantFailed(const char* expr, const char* file, unsigned line) noexcept {
    LOGV2_FATAL_CONTINUE(7100001,
                         "Invariant failure {expr} {file} {line}",
                         "expr"_attr = expr,
                         "file"_attr = file,
                         "line"_attr = line);
    LOGV2_FATAL_CONTINUE(7100002, "\n\n***aborting after invariant() failure\n\n");
    std::abort();
}

void invariantFailedWithMsg(const char* expr,
                            const std::string& msg,
                            const char* file,
                            unsigned line) noexcept {
    LOGV2_FATAL_CONTINUE(7100003,
                         "Invariant failure {expr} {msg} {file} {line}",
                         "expr"_attr = expr,
                         "msg"_attr = msg,
                         "file"_attr = file,
                         "line"_attr = line);
    LOGV2_FATAL_CONTINUE(7100004, "\n\n***aborting after invariant() failure\n\n");
    std::abort();
}

void invariantOKFailed(const char* expr,
                       const Status& status,
                       const char* file,
                       unsigned line) noexcept {
    LOGV2_FATAL_CONTINUE(7100005,
                         "Invariant failure {expr} resulted in status {error} at {file} {line}",
                         "expr"_attr = expr,
                         "error"_attr = status,
                         "file"_attr = file,
                         "line"_attr = line);
    LOGV2_FATAL_CONTINUE(7100006, "\n\n***aborting after invariant() failure\n\n");
    std::abort();
}

void uassertedWithLocation(const Status& status, const char* file, unsigned line) {
    LOGV2_DEBUG(7100007,
                1,
                "User assertion",
                "error"_attr = status,
                "file"_attr = file,
                "line"_attr = line);
    throw AssertionException(status);
}

void msgassertedWithLocation(const Status& status, const char* file, unsigned line) {
    LOGV2_ERROR(7100008,
                "Assertion {error} {file} {line}",
                "error"_attr = status,
                "file"_attr = file,
                "line"_attr = line);
    throw AssertionException(status);
}

std::string causedBy(const char* e) {
    constexpr auto prefix = " :: caused by :: ";
    return std::string(prefix) + e;
}

std::string causedBy(const DBException& e) {
    return causedBy(e.toString());
}

std::string causedBy(const std::exception& e) {
    return causedBy(e.what());
}

std::string causedBy(const std::string& e) {
    return causedBy(e.c_str());
}

std::string causedBy(const Status& e) {
    return causedBy(e.toString());
}

Status exceptionToStatus() noexcept {
    try {
        throw;
    } catch (const DBException& ex) {
        return ex.toStatus();
    } catch (const std::exception& ex) {
        return Status(ErrorCodes::UnknownError,
                      str::stream() << "Caught std::exception of type " << typeid(ex).name()
                                    << ": " << ex.what());
    } catch (...) {
        LOGV2_FATAL_CONTINUE(7100009, "Caught unknown exception in exceptionToStatus()");
        std::terminate();
    }
}

}  // namespace edmonds
