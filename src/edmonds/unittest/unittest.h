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

/*
 * A C++ unit testing framework.
 *
 * Tests are written with the GoogleTest TEST and TEST_F macros. This header adds the assertion
 * vocabulary used throughout the edmonds code base and a fixture base class with setUp/tearDown
 * hooks.
 *
 * For examples of basic usage, see edmonds/base/status_test.cpp.
 */

#pragma once

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "edmonds/base/status.h"
#include "edmonds/base/status_with.h"
#include "edmonds/util/assert_util.h"

/**
 * Fails unless "EXPRESSION" is true.
 */
#define ASSERT(EXPRESSION) ASSERT_TRUE(EXPRESSION)

#define ASSERT_EQUALS(a, b) ASSERT_EQ(a, b)
#define ASSERT_NOT_EQUALS(a, b) ASSERT_NE(a, b)
#define ASSERT_LESS_THAN(a, b) ASSERT_LT(a, b)
#define ASSERT_LESS_THAN_OR_EQUALS(a, b) ASSERT_LE(a, b)
#define ASSERT_GREATER_THAN(a, b) ASSERT_GT(a, b)
#define ASSERT_GREATER_THAN_OR_EQUALS(a, b) ASSERT_GE(a, b)

/**
 * Behaves like ASSERT_TRUE(EXPRESSION.isOK()), but on failure prints the Status. Accepts both
 * Status and StatusWith<T>.
 */
#define ASSERT_OK(EXPRESSION) ASSERT_EQUALS(::edmonds::Status::OK(), \
                                            ::edmonds::unittest::toStatus(EXPRESSION))

/**
 * Asserts that a Status or StatusWith<T> carries an error. Use ASSERT_EQUALS against an error
 * code when the exact code matters.
 */
#define ASSERT_NOT_OK(EXPRESSION) ASSERT_NOT_EQUALS(::edmonds::Status::OK(), \
                                                    ::edmonds::unittest::toStatus(EXPRESSION))

/**
 * Verifies that the given exception is thrown and has the expected code.
 */
#define ASSERT_THROWS_CODE(STATEMENT, EXCEPTION_TYPE, EXPECTED_CODE)                     \
    ASSERT_THROWS_WITH_CHECK(STATEMENT, EXCEPTION_TYPE, ([&](const EXCEPTION_TYPE& ex) { \
                                 ASSERT_EQUALS(ex.toStatus().code(), EXPECTED_CODE);    \
                             }))

/**
 * Verifies that the given exception is thrown and has the expected code and reason.
 */
#define ASSERT_THROWS_CODE_AND_WHAT(STATEMENT, EXCEPTION_TYPE, EXPECTED_CODE, EXPECTED_WHAT) \
    ASSERT_THROWS_WITH_CHECK(STATEMENT, EXCEPTION_TYPE, ([&](const EXCEPTION_TYPE& ex) {     \
                                 ASSERT_EQUALS(ex.toStatus().code(), EXPECTED_CODE);        \
                                 ASSERT_EQUALS(std::string(ex.what()),                      \
                                               std::string(EXPECTED_WHAT));                 \
                             }))

/**
 * Behaves like ASSERT_THROWS, above, but also calls CHECK(caughtException) which may contain
 * additional assertions.
 */
#define ASSERT_THROWS_WITH_CHECK(STATEMENT, EXCEPTION_TYPE, CHECK)              \
    do {                                                                       \
        bool threw_ = false;                                                   \
        try {                                                                  \
            STATEMENT;                                                         \
        } catch (const EXCEPTION_TYPE& ex) {                                   \
            threw_ = true;                                                     \
            CHECK(ex);                                                         \
        }                                                                      \
        ASSERT_TRUE(threw_) << "Statement " #STATEMENT                          \
                               " did not throw " #EXCEPTION_TYPE;               \
    } while (false)

#define ASSERT_THROWS(STATEMENT, EXCEPTION_TYPE) \
    ASSERT_THROWS_WITH_CHECK(STATEMENT, EXCEPTION_TYPE, ([](const EXCEPTION_TYPE&) {}))

#define ASSERT_STRING_CONTAINS(BIG_STRING, CONTAINS)                          \
    do {                                                                      \
        const std::string big_(BIG_STRING);                                   \
        const std::string small_(CONTAINS);                                   \
        ASSERT_NE(big_.find(small_), std::string::npos)                       \
            << "[" << big_ << "] does not contain [" << small_ << "]";         \
    } while (false)

namespace edmonds {
namespace unittest {

inline const Status& toStatus(const Status& s) {
    return s;
}

template <typename T>
Status toStatus(const StatusWith<T>& sw) {
    return sw.getStatus();
}

/**
 * Get the value out of a StatusWith<T>, or throw an exception if it is not OK.
 */
template <typename T>
const T& assertGet(const StatusWith<T>& swt) {
    uassertStatusOK(swt.getStatus());
    return swt.getValue();
}

template <typename T>
T assertGet(StatusWith<T>&& swt) {
    uassertStatusOK(swt.getStatus());
    return std::move(swt.getValue());
}

/**
 * Base type for unit test fixtures. Subclasses override setUp and tearDown instead of the
 * GoogleTest SetUp and TearDown hooks.
 */
class Test : public ::testing::Test {
public:
    Test() = default;
    ~Test() override = default;

protected:
    /**
     * Called on the test fixture before running the body of the test.
     */
    virtual void setUp() {}

    /**
     * Called on the test fixture after running the body of the test.
     */
    virtual void tearDown() {}

private:
    void SetUp() final {
        setUp();
    }

    void TearDown() final {
        tearDown();
    }
};

}  // namespace unittest
}  // namespace edmonds
