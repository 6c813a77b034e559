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

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace edmonds::logv2 {

/**
 * A named attribute attached to a log statement, created with the `_attr` literal:
 *
 *     LOGV2(7100101, "Stage complete", "stage"_attr = stage, "matched"_attr = pairs);
 *
 * The value is rendered once, when the statement is known to be emitted. `display` is the
 * plain text used when the message names the attribute as a `{placeholder}`; `json` is the
 * representation used in the trailing attribute object.
 */
struct NamedAttribute {
    const char* name;
    std::string display;
    std::string json;
};

namespace detail {

std::string escapeForJson(const std::string& s);

template <typename T>
std::string toDisplayString(const T& value) {
    if constexpr (fmt::is_formattable<T>::value) {
        return fmt::format("{}", value);
    } else {
        std::ostringstream os;
        os << value;
        return os.str();
    }
}

struct AttrUdl {
    const char* name;

    template <typename T>
    NamedAttribute operator=(const T& value) const {
        using Decayed = std::decay_t<T>;
        std::string display = toDisplayString(value);
        if constexpr (std::is_same_v<Decayed, bool>) {
            return {name, display, value ? "true" : "false"};
        } else if constexpr (std::is_arithmetic_v<Decayed>) {
            return {name, display, display};
        } else {
            std::string json = "\"" + escapeForJson(display) + "\"";
            return {name, std::move(display), std::move(json)};
        }
    }
};

}  // namespace detail

inline namespace literals {

constexpr detail::AttrUdl operator""_attr(const char* name, std::size_t) {
    return {name};
}

}  // namespace literals

}  // namespace edmonds::logv2
