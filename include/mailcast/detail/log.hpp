/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mailcast.
Supports multiple log levels and an optional callback sink.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

#include <mailcast/detail/ascii.hpp>

namespace mailcast::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Step-by-step pipeline tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (recoverable fallbacks)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as given on a command line, case-insensitive
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    constexpr level levels[] = {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off};
    for (level lvl : levels)
    {
        if (detail::iequals_ascii(name, level_to_string(lvl)))
            return lvl;
    }
    if (detail::iequals_ascii(name, "warning"))
        return level::warn;
    return std::nullopt;
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Log a message
    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream line;
        line << '[' << std::setfill('0')
             << std::setw(2) << tm_buf.tm_hour << ':'
             << std::setw(2) << tm_buf.tm_min << ':'
             << std::setw(2) << tm_buf.tm_sec << '.'
             << std::setw(3) << ms.count() << "] ["
             << level_to_string(e.lvl) << "] " << e.message << '\n';
        std::cerr << line.str();
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::warn)};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define MAILCAST_LOG(lvl, msg) \
    ::mailcast::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILCAST_TRACE(msg)  MAILCAST_LOG(::mailcast::log::level::trace, msg)
#define MAILCAST_DEBUG(msg)  MAILCAST_LOG(::mailcast::log::level::debug, msg)
#define MAILCAST_INFO(msg)   MAILCAST_LOG(::mailcast::log::level::info, msg)
#define MAILCAST_WARN(msg)   MAILCAST_LOG(::mailcast::log::level::warn, msg)
#define MAILCAST_ERROR(msg)  MAILCAST_LOG(::mailcast::log::level::error, msg)
#define MAILCAST_FATAL(msg)  MAILCAST_LOG(::mailcast::log::level::fatal, msg)

} // namespace mailcast::log
