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
#include <utility>
#include <vector>

#include "edmonds/base/error_codes.h"
#include "edmonds/base/status.h"
#include "edmonds/base/status_with.h"
#include "edmonds/unittest/unittest.h"
#include "edmonds/util/assert_util.h"

namespace edmonds {
namespace {

TEST(StatusWith, MakeCtad) {
    auto validate = [](auto&& arg) {
        auto sw = StatusWith(arg);
        ASSERT_TRUE(sw.isOK());
        ASSERT_TRUE(uassertStatusOK(sw) == arg);
    };
    validate(3);
    validate(false);
    validate(123.45);
    validate(std::string("foo"));
    validate(std::vector<int>({1, 2, 3}));
}

TEST(StatusWith, ConvertingConstructor) {
    StatusWith<std::string> sw("foo");
    ASSERT_OK(sw);
    ASSERT_EQUALS(sw.getValue(), "foo");
}

TEST(StatusWith, ErrorCase) {
    auto sw = StatusWith<int>(ErrorCodes::BadValue, "foo");
    ASSERT_NOT_OK(sw);
    ASSERT_EQUALS(sw.getStatus().code(), ErrorCodes::BadValue);
    ASSERT_EQUALS(sw.getStatus().reason(), "foo");
    ASSERT_TRUE(sw == ErrorCodes::BadValue);
    ASSERT_THROWS_CODE(uassertStatusOK(sw), AssertionException, ErrorCodes::BadValue);
}

TEST(StatusWith, nonDefaultConstructible) {
    class NoDefault {
    public:
        NoDefault() = delete;
        NoDefault(int x) : x{x} {}
        int x;
    };

    auto swND = StatusWith(NoDefault(1));
    ASSERT_EQ(swND.getValue().x, 1);

    auto swNDerror = StatusWith<NoDefault>(ErrorCodes::BadValue, "foo");
    ASSERT_FALSE(swNDerror.isOK());
}

TEST(StatusWith, ignoreTest) {
    // A compile-only test
    [] {
        return StatusWith(false);
    }()
        .getStatus()
        .ignore();
}

TEST(StatusWith, AssertGetMovesValue) {
    auto value = unittest::assertGet(StatusWith<std::vector<int>>(std::vector<int>{4, 5}));
    ASSERT_EQUALS(value.size(), 2U);
}

}  // namespace
}  // namespace edmonds
