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

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "edmonds/logv2/log_component.h"
#include "edmonds/logv2/log_severity.h"

namespace edmonds::logv2 {

/**
 * Container for the global logging state: per-component verbosity and the Boost.Log sinks
 * that receive formatted records. All members are safe to call concurrently.
 *
 * By default every record at severity Log() or more severe is written to std::clog.
 */
class LogManager {
public:
    LogManager();
    ~LogManager();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    static LogManager& global();

    /**
     * Sets the minimum severity logged for components without their own setting.
     */
    void setMinimumSeverity(LogSeverity severity);

    LogSeverity getMinimumSeverity() const;

    void setMinimumSeverity(LogComponent component, LogSeverity severity);

    /**
     * Makes `component` inherit the kDefault verbosity again.
     */
    void clearMinimumSeverity(LogComponent component);

    bool hasMinimumSeverity(LogComponent component) const;

    bool shouldLog(LogComponent component, LogSeverity severity) const;

    /**
     * Enables or disables the std::clog sink. Captured output is unaffected.
     */
    void setConsoleEnabled(bool enabled);

    /**
     * Captured records are the formatted records without timestamps, in emission order.
     */
    void startCapturingLogMessages();
    void stopCapturingLogMessages();
    std::vector<std::string> getCapturedLogMessages() const;
    int countCapturedLogLinesContaining(const std::string& needle) const;

    /**
     * Hands one formatted record to Boost.Log.
     */
    void write(const std::string& line);

    /**
     * Accepts the names returned by LogComponent::getShortName().
     */
    static boost::optional<LogComponent> parseComponent(const std::string& shortName);

private:
    struct Sinks;

    static constexpr int kUnset = -1000;

    std::atomic<int> _defaultSeverity;                                      // NOLINT
    std::array<std::atomic<int>, LogComponent::kNumLogComponents> _severities;  // NOLINT
    std::unique_ptr<Sinks> _sinks;
};

}  // namespace edmonds::logv2
