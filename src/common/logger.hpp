// SPDX-License-Identifier: Apache-2.0
// Asynchronous header-only logger used by the server, the test client and tests.
//  - Level filtering via ARENA_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines via ARENA_LOG_JSON presence
//  - Lines are queued and written to stderr by one background thread

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace arena::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {

struct line
{
    level lv;
    std::string text;
    std::chrono::system_clock::time_point ts;
};

struct sink
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};
    std::atomic<bool> running{false};
    std::once_flag started;
    std::mutex q_mtx;
    std::condition_variable q_cv;
    std::deque<line> queue;
    std::mutex io_mtx;
    std::thread writer;
};

inline sink &instance()
{
    static sink s;
    return s;
}

inline const char *level_tag(level lv)
{
    switch (lv) {
        case level::debug:
            return "D";
        case level::info:
            return "I";
        case level::warn:
            return "W";
        case level::error:
            return "E";
    }
    return "I";
}

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline level parse_level(std::string_view s)
{
    std::string v;
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

// JSON string body for a log message; control characters use \n, \t or \u00XX.
inline std::string json_escape(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        auto u = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (u < 0x20) {
            static const char hex[] = "0123456789abcdef";
            out += "\\u00";
            out.push_back(hex[u >> 4]);
            out.push_back(hex[u & 0xf]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

inline void emit(const line &ln)
{
    auto &s = instance();
    std::time_t tt = std::chrono::system_clock::to_time_t(ln.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::lock_guard lk(s.io_mtx);
    if (s.json.load(std::memory_order_relaxed)) {
        std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                  << level_name(ln.lv) << "\",\"msg\":\"" << json_escape(ln.text) << "\"}\n";
    } else {
        std::cerr << '[' << level_tag(ln.lv) << ' ' << std::put_time(&tm, "%H:%M:%S") << "] " << ln.text << '\n';
    }
    std::cerr.flush();
}

inline void writer_loop()
{
    auto &s = instance();
    for (;;) {
        std::deque<line> batch;
        {
            std::unique_lock lk(s.q_mtx);
            s.q_cv.wait(lk, [&] { return !s.queue.empty() || !s.running.load(std::memory_order_acquire); });
            batch.swap(s.queue);
        }
        for (auto &ln : batch)
            emit(ln);
        if (!s.running.load(std::memory_order_acquire) && batch.empty())
            break;
    }
}

inline void stop()
{
    auto &s = instance();
    if (!s.running.exchange(false, std::memory_order_acq_rel))
        return;
    s.q_cv.notify_all();
    if (s.writer.joinable())
        s.writer.join();
}

inline void apply_env()
{
    auto &s = instance();
    if (const char *lvl = std::getenv("ARENA_LOG_LEVEL"))
        s.min_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("ARENA_LOG_JSON"))
        s.json.store(true, std::memory_order_relaxed);
}

inline void start()
{
    auto &s = instance();
    std::call_once(s.started, [&] {
        apply_env();
        s.running.store(true, std::memory_order_release);
        s.writer = std::thread(writer_loop);
        std::atexit([] { stop(); });
    });
}

template <typename T>
inline std::string stringify(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_convertible_v<const T &, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" with the next argument; surplus arguments are appended.
template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    std::vector<std::string> values{stringify(args)...};
    std::string out;
    out.reserve(fmt.size() + values.size() * 8);
    size_t pos = 0;
    size_t idx = 0;
    while (idx < values.size()) {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos)
            break;
        out.append(fmt.substr(pos, p - pos));
        out += values[idx++];
        pos = p + 2;
    }
    out.append(fmt.substr(pos));
    for (; idx < values.size(); ++idx) {
        out.push_back(' ');
        out += values[idx];
    }
    return out;
}

} // namespace detail

// Re-reads ARENA_LOG_LEVEL / ARENA_LOG_JSON, so lines logged before the
// environment was seeded do not pin the defaults.
inline void init()
{
    detail::start();
    detail::apply_env();
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::instance().min_level.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto &s = detail::instance();
    detail::line ln{lv, std::move(msg), std::chrono::system_clock::now()};
    if (!s.running.load(std::memory_order_acquire)) {
        detail::emit(ln); // after shutdown: write synchronously
        return;
    }
    {
        std::lock_guard lk(s.q_mtx);
        s.queue.push_back(std::move(ln));
    }
    s.q_cv.notify_one();
}

inline void flush()
{
    detail::stop();
}

template <typename... Args>
inline void debug(std::string_view fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail::format(fmt, args...));
}

template <typename... Args>
inline void info(std::string_view fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail::format(fmt, args...));
}

template <typename... Args>
inline void warn(std::string_view fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail::format(fmt, args...));
}

template <typename... Args>
inline void error(std::string_view fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail::format(fmt, args...));
}

} // namespace arena::log
