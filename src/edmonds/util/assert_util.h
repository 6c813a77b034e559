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

#include <exception>
#include <string>

#include "edmonds/base/status.h"  // NOTE: This is safe as utils depend on base
#include "edmonds/base/status_with.h"
#include "edmonds/platform/compiler.h"

#define EDMONDS_INCLUDE_INVARIANT_H_WHITELISTED
#include "edmonds/util/invariant.h"
#undef EDMONDS_INCLUDE_INVARIANT_H_WHITELISTED

namespace edmonds {

class DBException;
std::string causedBy(const DBException& e);
std::string causedBy(const std::string& e);

/** Most edmonds exceptions inherit from this; this is commonly caught at API boundaries. */
class DBException : public std::exception {
public:
    explicit DBException(Status status) : _status(std::move(status)) {}

    const char* what() const noexcept override {
        return reason().c_str();
    }

    ErrorCodes::Error code() const {
        return _status.code();
    }

    const std::string& reason() const {
        return _status.reason();
    }

    std::string codeString() const {
        return _status.codeString();
    }

    const Status& toStatus() const {
        return _status;
    }

    Status toStatus(const std::string& context) const {
        return _status.withContext(context);
    }

    std::string toString() const {
        return _status.toString();
    }

    void addContext(const std::string& context) {
        _status.addContext(context);
    }

private:
    Status _status;
};

/**
 * Thrown by uassert (user errors: bad input, unsupported graph kinds) and massert (internal
 * errors with a well defined message).
 */
class AssertionException : public DBException {
public:
    explicit AssertionException(Status status) : DBException(std::move(status)) {}
};

EDMONDS_COMPILER_NORETURN void invariantOKFailed(const char* expr,
                                                 const Status& status,
                                                 const char* file,
                                                 unsigned line) noexcept;

/** a "user assertion".  throws AssertionException.  logs.  typically used for errors that a
    user could cause, such as a directed input graph or a non-integral weight.
*/
EDMONDS_COMPILER_NORETURN void uassertedWithLocation(const Status& status,
                                                     const char* file,
                                                     unsigned line);

inline void uassertedWithLocation(int msgid,
                                  const std::string& msg,
                                  const char* file,
                                  unsigned line) {
    uassertedWithLocation(Status(ErrorCodes::Error(msgid), msg), file, line);
}

/** msgassert and massert are for errors that are internal but have a well defined error text
    std::string.
*/
EDMONDS_COMPILER_NORETURN void msgassertedWithLocation(const Status& status,
                                                       const char* file,
                                                       unsigned line);

inline void msgassertedWithLocation(int msgid,
                                    const std::string& msg,
                                    const char* file,
                                    unsigned line) {
    msgassertedWithLocation(Status(ErrorCodes::Error(msgid), msg), file, line);
}

/* convert various types of exceptions to strings */
std::string causedBy(const char* e);
std::string causedBy(const std::exception& e);
std::string causedBy(const Status& e);

/**
 * "user assert".  if asserts, user did something wrong, not our code.
 *
 * Using an immediately invoked lambda to give the compiler an easy way to inline the check (expr)
 * and out-of-line the error path. This is most helpful when the error path involves building a
 * complex error message in the expansion of msg. The call to the lambda is followed by
 * EDMONDS_COMPILER_UNREACHABLE as it is impossible to mark a lambda noreturn.
 */
#define uassert EDMONDS_uassert
#define EDMONDS_uassert(msgid, msg, expr)                                         \
    do {                                                                          \
        if (EDMONDS_unlikely(!(expr))) {                                          \
            [&]() EDMONDS_COMPILER_COLD_FUNCTION {                                \
                ::edmonds::uassertedWithLocation(msgid, msg, __FILE__, __LINE__); \
            }();                                                                  \
            EDMONDS_COMPILER_UNREACHABLE;                                         \
        }                                                                         \
    } while (false)

#define uasserted EDMONDS_uasserted
#define EDMONDS_uasserted(...) ::edmonds::uassertedWithLocation(__VA_ARGS__, __FILE__, __LINE__)

#define uassertStatusOK EDMONDS_uassertStatusOK
#define EDMONDS_uassertStatusOK(...) \
    ::edmonds::uassertStatusOKWithLocation(__VA_ARGS__, __FILE__, __LINE__)
inline void uassertStatusOKWithLocation(const Status& status, const char* file, unsigned line) {
    if (EDMONDS_unlikely(!status.isOK())) {
        uassertedWithLocation(status, file, line);
    }
}

template <typename T>
inline T uassertStatusOKWithLocation(StatusWith<T> sw, const char* file, unsigned line) {
    uassertStatusOKWithLocation(sw.getStatus(), file, line);
    return std::move(sw.getValue());
}

/* display a message, no context, and throw assertionexception

   easy way to throw an exception and log something without our stack trace
   display happening.
*/
#define massert EDMONDS_massert
#define EDMONDS_massert(msgid, msg, expr)                                           \
    do {                                                                            \
        if (EDMONDS_unlikely(!(expr))) {                                            \
            [&]() EDMONDS_COMPILER_COLD_FUNCTION {                                  \
                ::edmonds::msgassertedWithLocation(msgid, msg, __FILE__, __LINE__); \
            }();                                                                    \
            EDMONDS_COMPILER_UNREACHABLE;                                           \
        }                                                                           \
    } while (false)

#define msgasserted EDMONDS_msgasserted
#define EDMONDS_msgasserted(...) \
    ::edmonds::msgassertedWithLocation(__VA_ARGS__, __FILE__, __LINE__)

#define massertStatusOK EDMONDS_massertStatusOK
#define EDMONDS_massertStatusOK(...) \
    ::edmonds::massertStatusOKWithLocation(__VA_ARGS__, __FILE__, __LINE__)
inline void massertStatusOKWithLocation(const Status& status, const char* file, unsigned line) {
    if (EDMONDS_unlikely(!status.isOK())) {
        msgassertedWithLocation(status, file, line);
    }
}

#define invariantOK EDMONDS_invariantOK
#define EDMONDS_invariantOK(expression)                                                         \
    do {                                                                                        \
        const ::edmonds::Status _invariantOK_status = expression;                               \
        if (EDMONDS_unlikely(!_invariantOK_status.isOK())) {                                    \
            ::edmonds::invariantOKFailed(#expression, _invariantOK_status, __FILE__, __LINE__); \
        }                                                                                       \
    } while (false)

/**
 * A utility function that converts an exception to a Status.
 * Only call this function when there is an active exception
 * (e.g. in a catch block).
 *
 * Note: this technique was created by Lisa Lippincott.
 *
 * Example usage:
 *
 *   Status myFunc() {
 *       try {
 *           funcThatThrows();
 *           return Status::OK();
 *       } catch (...) {
 *           return exceptionToStatus();
 *       }
 *   }
 */
Status exceptionToStatus() noexcept;

}  // namespace edmonds

/**
 * The purpose of this macro is to instruct the compiler that a line of code will never be reached.
 *
 * Example:
 *     // code above checks that expr can only be FOO or BAR
 *     switch (expr) {
 *     case FOO: { ... }
 *     case BAR: { ... }
 *     default:
 *         EDMONDS_UNREACHABLE;
 */
#define EDMONDS_UNREACHABLE \
    ::edmonds::invariantFailed("Hit a EDMONDS_UNREACHABLE!", __FILE__, __LINE__);
