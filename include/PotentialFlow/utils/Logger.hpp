// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h> // for ostream support
#include <cstdlib>
#include <memory>
#include <string>

#include <glm/glm.hpp>

template <int D, typename T, glm::qualifier Q>
struct fmt::formatter<glm::vec<D, T, Q>>
{
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const glm::vec<D, T, Q> &v, FormatContext &ctx) const
    {
        auto out = ctx.out();
        out = fmt::format_to(out, "[");
        for (int i = 0; i < D; ++i)
        {
            out = fmt::format_to(out, "{:.4f}{}", v[i], (i < D - 1) ? ", " : "");
        }
        out = fmt::format_to(out, "]");
        return out;
    }
};

namespace pflow
{
    class Logger
    {
    public:
        static void init(const std::string &level_str = "info", const std::string &log_filepath = "potential_flow.log");

        // console-only logger for contexts without a config file (tests, python host)
        static void initConsole(const std::string &level_str = "warn");

        static std::shared_ptr<spdlog::logger> &getCoreLogger();

    private:
        static void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level);

        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

#define LOG_TRACE(fmt, ...) ::pflow::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::pflow::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) ::pflow::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) ::pflow::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) ::pflow::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::err, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) ::pflow::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::critical, fmt, ##__VA_ARGS__)

#ifdef NDEBUG // Release mode
#define ASSERT(condition, fmt, ...) ((void)0)
#else // Debug mode
#define ASSERT(condition, fmt, ...)                            \
    if (!(condition))                                          \
    {                                                          \
        LOG_CRITICAL("Assertion Failed: " fmt, ##__VA_ARGS__); \
        std::abort();                                          \
    }
#endif

} // namespace pflow
