// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/utils/Logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <vector>
#include <map>
#include <iostream>

namespace pflow {
std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;

namespace {
const char* kLoggerName = "POTFLOW";

spdlog::level::level_enum parseLevel(const std::string& level_str) {
    const std::map<std::string, spdlog::level::level_enum> level_map = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };

    auto it = level_map.find(level_str);
    if (it != level_map.end()) {
        return it->second;
    }
    // Logger is not usable yet, report on stderr
    std::cerr << "[Logger Warning] Invalid log level string '" << level_str
              << "'. Defaulting to 'info'." << std::endl;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> makeConsoleSink(spdlog::level::level_enum log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
#ifdef NDEBUG
    console_sink->set_pattern("%^[%T] [%l] %v%$");
    // release builds keep the console at info or above, the file sink gets everything
    console_sink->set_level(std::max(log_level, spdlog::level::info));
#else
    console_sink->set_pattern("%^[%T.%e] [%l] [thread %t] %v%$ %@");
    console_sink->set_level(log_level);
#endif
    return console_sink;
}
} // namespace

void Logger::init(const std::string& level_str, const std::string& log_filepath) {
    spdlog::level::level_enum log_level = parseLevel(level_str);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(makeConsoleSink(log_level));

    // truncate the log file on every run
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_filepath, true);
    file_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] [thread %t] [%s:%# %!()] %v");
    sinks.push_back(file_sink);

    install(std::make_shared<spdlog::logger>(kLoggerName, begin(sinks), end(sinks)), log_level);
}

void Logger::initConsole(const std::string& level_str) {
    spdlog::level::level_enum log_level = parseLevel(level_str);
    spdlog::sink_ptr console_sink = makeConsoleSink(log_level);
    install(std::make_shared<spdlog::logger>(kLoggerName, console_sink), log_level);
}

std::shared_ptr<spdlog::logger>& Logger::getCoreLogger() {
    if (!s_CoreLogger) {
        initConsole("info");
    }
    return s_CoreLogger;
}

void Logger::install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    // a second init (config reload, python host) replaces the registered instance
    spdlog::drop(kLoggerName);

    s_CoreLogger = std::move(logger);
    spdlog::register_logger(s_CoreLogger);

    s_CoreLogger->set_level(level);
    s_CoreLogger->flush_on(spdlog::level::warn);
}

} // namespace pflow
