/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header-only logging for postino: rejected input at debug level, framing and
transfer encoding decisions at trace level, skipped mailbox entries at warn
level. Entries go to stderr unless a callback is installed.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <format>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <postino/detail/ascii.hpp>

namespace postino::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Codec decisions (very verbose)
    debug = 1,   ///< Rejected input and its reason
    info = 2,    ///< Informational messages
    warn = 3,    ///< Input skipped by a lenient reader
    error = 4,   ///< Operation failures
    fatal = 5,   ///< Unrecoverable failures
    off = 6      ///< Logging disabled
};

/// Log entry passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;
};

using callback_t = std::function<void(const entry&)>;

/// Environment variable read by `logger::configure_from_env()`
inline constexpr const char* LEVEL_ENV_VAR = "POSTINO_LOG_LEVEL";

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

/**
Level for a name as printed by `level_to_string(level)`, in any case.

@param name Level name.
@return     Level, or nothing for an unknown name.
**/
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    for (auto lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off})
        if (postino::detail::iequals_ascii(name, level_to_string(lvl)))
            return lvl;
    return std::nullopt;
}

/// Process wide logger (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /**
    Setting the level from the `POSTINO_LOG_LEVEL` environment variable.

    @return True if the variable holds a level name, false if it is unset or unknown, the level being left unchanged.
    **/
    bool configure_from_env()
    {
        const char* value = std::getenv(LEVEL_ENV_VAR);
        if (value == nullptr)
            return false;
        auto lvl = level_from_string(value);
        if (!lvl)
            return false;
        set_level(*lvl);
        return true;
    }

    /// Callback replacing the stderr sink
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

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

        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            write_stderr(e);
    }

private:
    logger() = default;

    // [hh:mm:ss.mmm] [LEVEL] file:line message
    static void write_stderr(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::string_view file = e.location.file_name();
        if (auto slash = file.find_last_of("/\\"); slash != std::string_view::npos)
            file.remove_prefix(slash + 1);

        std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] [{}] {}:{} {}\n", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
            level_to_string(e.lvl), file, e.location.line(), e.message);
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

#define POSTINO_LOG(lvl, msg) \
    ::postino::log::logger::instance().log(lvl, msg, std::source_location::current())

#define POSTINO_TRACE(msg)  POSTINO_LOG(::postino::log::level::trace, msg)
#define POSTINO_DEBUG(msg)  POSTINO_LOG(::postino::log::level::debug, msg)
#define POSTINO_INFO(msg)   POSTINO_LOG(::postino::log::level::info, msg)
#define POSTINO_WARN(msg)   POSTINO_LOG(::postino::log::level::warn, msg)
#define POSTINO_ERROR(msg)  POSTINO_LOG(::postino::log::level::error, msg)
#define POSTINO_FATAL(msg)  POSTINO_LOG(::postino::log::level::fatal, msg)

} // namespace postino::log
