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

/**
 * Structured logging.
 *
 * Every translation unit that logs defines the component its records belong to before
 * including this header:
 *
 *     #define EDMONDS_LOGV2_DEFAULT_COMPONENT ::edmonds::logv2::LogComponent::kMatching
 *     #include "edmonds/logv2/log.h"
 *
 * Each statement carries a numeric id that is unique across the code base, a constant message
 * and any number of named attributes:
 *
 *     LOGV2(7100101, "Stage complete", "stage"_attr = stage);
 *     LOGV2_DEBUG(7100102, 2, "Dual update", "delta"_attr = delta, "kind"_attr = kind);
 *
 * Attribute expressions are evaluated only when the record passes the severity filter.
 */

#pragma once

#include <cstdlib>

#include "edmonds/logv2/attribute.h"
#include "edmonds/logv2/log_component.h"
#include "edmonds/logv2/log_detail.h"
#include "edmonds/logv2/log_manager.h"
#include "edmonds/logv2/log_severity.h"

namespace edmonds {
using namespace logv2::literals;
}  // namespace edmonds

#define LOGV2_IMPL(ID, SEVERITY, COMPONENT, MESSAGE, ...)                                   \
    do {                                                                                   \
        const ::edmonds::logv2::LogSeverity logv2Severity_ = (SEVERITY);                   \
        const ::edmonds::logv2::LogComponent logv2Component_ = (COMPONENT);                \
        if (::edmonds::logv2::LogManager::global().shouldLog(logv2Component_,              \
                                                             logv2Severity_)) {            \
            ::edmonds::logv2::detail::doLog(                                               \
                ID, logv2Severity_, logv2Component_, MESSAGE __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                                  \
    } while (false)

#define LOGV2(ID, MESSAGE, ...)                          \
    LOGV2_IMPL(ID,                                       \
               ::edmonds::logv2::LogSeverity::Log(),     \
               EDMONDS_LOGV2_DEFAULT_COMPONENT,          \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_INFO(ID, MESSAGE, ...)                     \
    LOGV2_IMPL(ID,                                       \
               ::edmonds::logv2::LogSeverity::Info(),    \
               EDMONDS_LOGV2_DEFAULT_COMPONENT,          \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_WARNING(ID, MESSAGE, ...)                  \
    LOGV2_IMPL(ID,                                       \
               ::edmonds::logv2::LogSeverity::Warning(), \
               EDMONDS_LOGV2_DEFAULT_COMPONENT,          \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_ERROR(ID, MESSAGE, ...)                    \
    LOGV2_IMPL(ID,                                       \
               ::edmonds::logv2::LogSeverity::Error(),   \
               EDMONDS_LOGV2_DEFAULT_COMPONENT,          \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

/**
 * Logs at Severe and aborts the process.
 */
#define LOGV2_FATAL(ID, MESSAGE, ...)                                  \
    do {                                                               \
        LOGV2_IMPL(ID,                                                 \
                   ::edmonds::logv2::LogSeverity::Severe(),            \
                   EDMONDS_LOGV2_DEFAULT_COMPONENT,                    \
                   MESSAGE __VA_OPT__(, ) __VA_ARGS__);                \
        ::std::abort();                                                \
    } while (false)

/**
 * Logs at Severe without terminating. The caller is expected to abort.
 */
#define LOGV2_FATAL_CONTINUE(ID, MESSAGE, ...)           \
    LOGV2_IMPL(ID,                                       \
               ::edmonds::logv2::LogSeverity::Severe(),  \
               EDMONDS_LOGV2_DEFAULT_COMPONENT,          \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_DEBUG(ID, DLEVEL, MESSAGE, ...)                   \
    LOGV2_IMPL(ID,                                              \
               ::edmonds::logv2::LogSeverity::Debug(DLEVEL),    \
               EDMONDS_LOGV2_DEFAULT_COMPONENT,                 \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_DEBUG_OPTIONS(ID, DLEVEL, COMPONENT, MESSAGE, ...) \
    LOGV2_IMPL(ID,                                               \
               ::edmonds::logv2::LogSeverity::Debug(DLEVEL),     \
               COMPONENT,                                        \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)
