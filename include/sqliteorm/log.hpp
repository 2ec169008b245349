/**
 * @file log.hpp
 * @brief Callback-routed logging for the library
 *
 * The library never writes to stdout/stderr on its own. Log lines are
 * built with a stream-like object and handed to a callback installed by
 * the application, which routes them to whatever logger it already uses:
 *
 *   sqliteorm::log::setCallback([](sqliteorm::log::Level level,
 *                                   const char* msg, size_t len) {
 *       std::cerr << sqliteorm::log::levelName(level) << ": "
 *                 << std::string(msg, len) << "\n";
 *   });
 *
 * Inside the library:
 *   SQLITEORM_LOG_ERROR << "commit failed: " << e.what();
 *
 * With no callback installed (the default) messages are dropped.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace sqliteorm {
namespace log {

enum class Level : uint8_t { Debug, Info, Warn, Error };

using Callback = void (*)(Level level, const char* msg, size_t len);

namespace detail {
    inline Callback& ref() noexcept {
        static Callback cb = nullptr;
        return cb;
    }
} // namespace detail

/**
 * @brief Install the log callback; nullptr disables logging
 */
inline void setCallback(Callback cb) noexcept { detail::ref() = cb; }

inline Callback getCallback() noexcept { return detail::ref(); }

inline const char* levelName(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

/**
 * @brief Accumulates one log message and dispatches it on destruction
 */
class LogStream {
public:
    explicit LogStream(Level level) noexcept : level_(level) {}

    ~LogStream() {
        if (auto cb = getCallback()) {
            cb(level_, buf_.data(), buf_.size());
        }
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    LogStream& operator<<(const char* s) {
        if (s) buf_ += s;
        return *this;
    }

    LogStream& operator<<(const std::string& s) {
        buf_ += s;
        return *this;
    }

    LogStream& operator<<(char c) {
        buf_ += c;
        return *this;
    }

    template<typename T,
             typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, char>>>
    LogStream& operator<<(T val) {
        buf_ += std::to_string(val);
        return *this;
    }

    LogStream& operator<<(double val) {
        buf_ += std::to_string(val);
        return *this;
    }

private:
    Level level_;
    std::string buf_;
};

} // namespace log
} // namespace sqliteorm

#define SQLITEORM_LOG_DEBUG ::sqliteorm::log::LogStream(::sqliteorm::log::Level::Debug)
#define SQLITEORM_LOG_INFO  ::sqliteorm::log::LogStream(::sqliteorm::log::Level::Info)
#define SQLITEORM_LOG_WARN  ::sqliteorm::log::LogStream(::sqliteorm::log::Level::Warn)
#define SQLITEORM_LOG_ERROR ::sqliteorm::log::LogStream(::sqliteorm::log::Level::Error)
