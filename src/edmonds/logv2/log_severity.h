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

#include <iosfwd>
#include <string>

namespace edmonds::logv2 {

/**
 * Representation of the severity / priority of a log message.
 *
 * Severities are totally ordered, from most severe to least severe as follows:
 * Severe, Error, Warning, Info, Log, Debug(1), Debug(2), ...
 */
class LogSeverity {
public:
    //
    // Static factory methods for getting LogSeverity objects of the various severity levels.
    //

    static constexpr LogSeverity Severe() {
        return LogSeverity(-4);
    }
    static constexpr LogSeverity Error() {
        return LogSeverity(-3);
    }
    static constexpr LogSeverity Warning() {
        return LogSeverity(-2);
    }
    static constexpr LogSeverity Info() {
        return LogSeverity(-1);
    }
    static constexpr LogSeverity Log() {  // === Debug(0)
        return LogSeverity(0);
    }

    static constexpr int kMaxDebugLevel = 5;

    // Construct a LogSeverity to represent the given debug level. Levels above kMaxDebugLevel
    // are clamped.
    static constexpr LogSeverity Debug(int debugLevel) {
        return LogSeverity(debugLevel > kMaxDebugLevel ? kMaxDebugLevel : debugLevel);
    }

    /**
     * Casts an integer to a severity.
     *
     * Do not use this.  It exists to enable a handful of leftover uses of LOG(0).
     */
    static constexpr LogSeverity cast(int ll) {
        return LogSeverity(ll);
    }

    constexpr int toInt() const {
        return _severity;
    }

    /**
     * Returns a LogSeverity object that is one unit "more severe" than this one.
     */
    constexpr LogSeverity moreSevere() const {
        return LogSeverity(_severity - 1);
    }

    /**
     * Returns a LogSeverity object that is one unit "less severe" than this one.
     */
    constexpr LogSeverity lessSevere() const {
        return LogSeverity(_severity + 1);
    }

    /**
     * Returns a std::string naming this severity level.
     *
     * See toStringData(), below.
     */
    std::string toString() const;

    /**
     * Returns one of "SEVERE", "ERROR", "warning", "info", "log", "debug", or "UNKNOWN".
     */
    const char* toStringData() const;

    /**
     * Returns a single capital letter naming this severity level.
     * Example: "I" for Info.
     */
    const char* toStringDataCompact() const;

    //
    // Comparison operations. A "lower" severity is less important.
    //

    /// Returns true if this is exactly as severe as other.
    constexpr bool operator==(const LogSeverity other) const {
        return _severity == other._severity;
    }

    /// Returns true if this is not exactly as severe as other.
    constexpr bool operator!=(const LogSeverity other) const {
        return _severity != other._severity;
    }

    /// Returns true if this is less severe than other.
    constexpr bool operator<(const LogSeverity other) const {
        return _severity > other._severity;
    }

    /// Returns true if this is no more severe than other.
    constexpr bool operator<=(const LogSeverity other) const {
        return _severity >= other._severity;
    }

    /// Returns true if this is more severe than other.
    constexpr bool operator>(const LogSeverity other) const {
        return _severity < other._severity;
    }

    /// Returns true if this is no less severe than other.
    constexpr bool operator>=(const LogSeverity other) const {
        return _severity <= other._severity;
    }

private:
    explicit constexpr LogSeverity(int severity) : _severity(severity) {}

    /// The stored severity.  More negative is more severe.
    int _severity;
};

std::ostream& operator<<(std::ostream& os, LogSeverity severity);

}  // namespace edmonds::logv2
