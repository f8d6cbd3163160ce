// jbsync_log.hpp - JBeam Sync - Logging
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_LOG_HPP
#define JBSYNC_LOG_HPP

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>

namespace jbsync::log
{
//========================================================================
// Logger setup
//========================================================================

    // Installs a coloured stdout logger as the spdlog default. Without a
    // call the library logs through whatever default spdlog provides.
    inline void init(spdlog::level::level_enum level = spdlog::level::info)
    {
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("jbsync", sink);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%T] [%^%l%$] %v");
        spdlog::set_level(level);
    }

    inline void set_level(spdlog::level::level_enum level)
    {
        spdlog::set_level(level);
    }

//========================================================================
// Forwarders
//========================================================================

    template <class... Args>
    inline void info(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::info(f, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void warn(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::warn(f, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void error(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::error(f, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void debug(fmt::format_string<Args...> f, Args&&... args)
    {
        spdlog::debug(f, std::forward<Args>(args)...);
    }

} // namespace jbsync::log

#endif
