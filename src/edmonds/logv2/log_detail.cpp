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

#include "edmonds/logv2/log_detail.h"

#include <fmt/args.h>
#include <fmt/format.h>

#include "edmonds/logv2/log_manager.h"

namespace edmonds::logv2::detail {

std::string escapeForJson(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

namespace {

std::string substitutePlaceholders(const char* message, const std::vector<NamedAttribute>& attrs) {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& attr : attrs)
        store.push_back(fmt::arg(attr.name, attr.display));
    try {
        return fmt::vformat(fmt::string_view(message), store);
    } catch (const fmt::format_error&) {
        // Messages with braces that do not name an attribute are logged verbatim.
        return message;
    }
}

}  // namespace

std::string formatRecord(std::int32_t id,
                         LogSeverity severity,
                         LogComponent component,
                         const char* message,
                         const std::vector<NamedAttribute>& attrs) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf),
                   R"({{"s":"{}","c":"{}","id":{},"msg":"{}")",
                   severity.toStringDataCompact(),
                   component.getNameForLog(),
                   id,
                   escapeForJson(substitutePlaceholders(message, attrs)));
    if (!attrs.empty()) {
        fmt::format_to(std::back_inserter(buf), R"(,"attr":{{)");
        bool first = true;
        for (const auto& attr : attrs) {
            fmt::format_to(std::back_inserter(buf),
                           R"({}"{}":{})",
                           first ? "" : ",",
                           attr.name,
                           attr.json);
            first = false;
        }
        buf.push_back('}');
    }
    buf.push_back('}');
    return fmt::to_string(buf);
}

void doLogImpl(std::int32_t id,
               LogSeverity severity,
               LogComponent component,
               const char* message,
               const std::vector<NamedAttribute>& attrs) {
    LogManager::global().write(formatRecord(id, severity, component, message, attrs));
}

}  // namespace edmonds::logv2::detail
