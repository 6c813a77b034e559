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

#include "edmonds/logv2/log_manager.h"

#include <algorithm>
#include <iostream>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace edmonds::logv2 {

namespace {

namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

/**
 * Keeps formatted records in memory so that tests can assert on log output.
 */
class CaptureBackend
    : public sinks::basic_formatted_sink_backend<char, sinks::synchronized_feeding> {
public:
    void consume(const boost::log::record_view&, const string_type& formatted) {
        std::lock_guard<std::mutex> lk(_mutex);
        _lines.push_back(formatted);
    }

    void clear() {
        std::lock_guard<std::mutex> lk(_mutex);
        _lines.clear();
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lk(_mutex);
        return _lines;
    }

private:
    mutable std::mutex _mutex;
    std::vector<std::string> _lines;
};

using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
using CaptureSink = sinks::synchronous_sink<CaptureBackend>;

}  // namespace

struct LogManager::Sinks {
    boost::log::sources::logger_mt logger;
    boost::shared_ptr<ConsoleSink> console;
    boost::shared_ptr<CaptureBackend> captureBackend;
    boost::shared_ptr<CaptureSink> capture;
    std::mutex mutex;
    bool consoleEnabled = false;
    bool capturing = false;
};

LogManager::LogManager()
    : _defaultSeverity(LogSeverity::Log().toInt()), _sinks(std::make_unique<Sinks>()) {
    for (auto& severity : _severities)
        severity.store(kUnset);

    auto core = boost::log::core::get();
    boost::log::add_common_attributes();

    auto backend = boost::make_shared<sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);
    _sinks->console = boost::make_shared<ConsoleSink>(backend);
    _sinks->console->set_formatter(
        expr::stream << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                        "%Y-%m-%dT%H:%M:%S.%f")
                     << " " << expr::smessage);

    _sinks->captureBackend = boost::make_shared<CaptureBackend>();
    _sinks->capture = boost::make_shared<CaptureSink>(_sinks->captureBackend);
    _sinks->capture->set_formatter(expr::stream << expr::smessage);

    core->add_sink(_sinks->console);
    _sinks->consoleEnabled = true;
}

LogManager::~LogManager() {
    auto core = boost::log::core::get();
    std::lock_guard<std::mutex> lk(_sinks->mutex);
    if (_sinks->consoleEnabled)
        core->remove_sink(_sinks->console);
    if (_sinks->capturing)
        core->remove_sink(_sinks->capture);
}

LogManager& LogManager::global() {
    static LogManager* manager = new LogManager();
    return *manager;
}

void LogManager::setMinimumSeverity(LogSeverity severity) {
    _defaultSeverity.store(severity.toInt());
}

LogSeverity LogManager::getMinimumSeverity() const {
    return LogSeverity::cast(_defaultSeverity.load());
}

void LogManager::setMinimumSeverity(LogComponent component, LogSeverity severity) {
    if (component == LogComponent::kDefault) {
        setMinimumSeverity(severity);
        return;
    }
    _severities[component].store(severity.toInt());
}

void LogManager::clearMinimumSeverity(LogComponent component) {
    _severities[component].store(kUnset);
}

bool LogManager::hasMinimumSeverity(LogComponent component) const {
    return _severities[component].load() != kUnset;
}

bool LogManager::shouldLog(LogComponent component, LogSeverity severity) const {
    int threshold = _severities[component].load();
    if (threshold == kUnset)
        threshold = _defaultSeverity.load();
    return severity >= LogSeverity::cast(threshold);
}

void LogManager::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lk(_sinks->mutex);
    if (enabled == _sinks->consoleEnabled)
        return;
    auto core = boost::log::core::get();
    if (enabled)
        core->add_sink(_sinks->console);
    else
        core->remove_sink(_sinks->console);
    _sinks->consoleEnabled = enabled;
}

void LogManager::startCapturingLogMessages() {
    std::lock_guard<std::mutex> lk(_sinks->mutex);
    _sinks->captureBackend->clear();
    if (!_sinks->capturing)
        boost::log::core::get()->add_sink(_sinks->capture);
    _sinks->capturing = true;
}

void LogManager::stopCapturingLogMessages() {
    std::lock_guard<std::mutex> lk(_sinks->mutex);
    if (_sinks->capturing)
        boost::log::core::get()->remove_sink(_sinks->capture);
    _sinks->capturing = false;
}

std::vector<std::string> LogManager::getCapturedLogMessages() const {
    return _sinks->captureBackend->lines();
}

int LogManager::countCapturedLogLinesContaining(const std::string& needle) const {
    auto lines = getCapturedLogMessages();
    return std::count_if(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

void LogManager::write(const std::string& line) {
    boost::log::record rec = _sinks->logger.open_record();
    if (rec) {
        boost::log::record_ostream strm(rec);
        strm << line;
        strm.flush();
        _sinks->logger.push_record(std::move(rec));
    }
}

boost::optional<LogComponent> LogManager::parseComponent(const std::string& shortName) {
    for (int i = 0; i < LogComponent::kNumLogComponents; ++i) {
        LogComponent component(static_cast<LogComponent::Value>(i));
        if (component.getShortName() == shortName)
            return component;
    }
    return boost::none;
}

}  // namespace edmonds::logv2
