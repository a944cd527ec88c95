// bough_log.hpp - Bough - Diagnostic Log
// Version 0.1.0
// Copyright 2026 The Bough Authors
// Licenced as-is under the MIT licence.

#ifndef BOUGH_LOG_HPP
#define BOUGH_LOG_HPP

#include <cstdio>
#include <functional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace bough::log
{
//========================================================================
// Levels and sinks
//========================================================================

    enum class level
    {
        none,
        error,
        warning,
        info,
        debug
    };

    // Receives every message that passes the level filter. Hosts install
    // their own to route messages into a status line or a file.
    using sink_type = std::function<void(level, std::string_view)>;

    inline std::string_view level_name(level lv)
    {
        switch (lv)
        {
            case level::error:   return "error";
            case level::warning: return "warning";
            case level::info:    return "info";
            case level::debug:   return "debug";
            default:             return "none";
        }
    }

    namespace detail
    {
        inline void stderr_sink(level lv, std::string_view message)
        {
            fmt::print(stderr, "[{}] {}\n", level_name(lv), message);
        }

        inline level & max_level()
        {
            static level lv = level::warning;
            return lv;
        }

        inline sink_type & current_sink()
        {
            static sink_type sink = stderr_sink;
            return sink;
        }
    }

    inline void set_level(level lv) { detail::max_level() = lv; }
    inline level get_level() { return detail::max_level(); }

    // An empty sink restores the stderr default
    inline void set_sink(sink_type sink)
    {
        detail::current_sink() = sink ? std::move(sink) : sink_type(detail::stderr_sink);
    }

    inline bool enabled(level lv)
    {
        return lv != level::none && lv <= detail::max_level();
    }

//========================================================================
// Writers
//========================================================================

    inline void write_args(level lv, fmt::string_view format, fmt::format_args args)
    {
        detail::current_sink()(lv, fmt::vformat(format, args));
    }

    template <typename... T>
    inline void write(level lv, fmt::format_string<T...> format, T&&... args)
    {
        if (enabled(lv))
            write_args(lv, format, fmt::make_format_args(args...));
    }

    template <typename... T>
    inline void error(fmt::format_string<T...> format, T&&... args)
    {
        write(level::error, format, std::forward<T>(args)...);
    }

    template <typename... T>
    inline void warning(fmt::format_string<T...> format, T&&... args)
    {
        write(level::warning, format, std::forward<T>(args)...);
    }

    template <typename... T>
    inline void info(fmt::format_string<T...> format, T&&... args)
    {
        write(level::info, format, std::forward<T>(args)...);
    }

    template <typename... T>
    inline void debug(fmt::format_string<T...> format, T&&... args)
    {
        write(level::debug, format, std::forward<T>(args)...);
    }

} // namespace bough::log

#endif // BOUGH_LOG_HPP
