// SPDX-License-Identifier: Apache-2.0
// Asynchronous header-only logger.
//  - level filter from ARENA_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines when ARENA_LOG_JSON is set
//  - messages are queued and written to stderr by one background thread so the
//    tick loop and request handlers never block on terminal I/O

#pragma once

#include <array>
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

namespace arena::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {

struct record
{
    level lv;
    std::string text;
    std::chrono::system_clock::time_point ts;
};

struct state
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::mutex queue_mtx;
    std::condition_variable queue_cv;
    std::deque<record> queue;
    std::mutex io_mtx;
    std::thread worker;
};

inline state &global()
{
    static state s;
    return s;
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
    v.reserve(s.size());
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

template <typename T>
inline std::string to_text(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(3);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" in fmt with the next argument; surplus arguments are appended space separated.
template <typename... Args>
inline std::string format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        std::array<std::string, sizeof...(Args)> values{to_text(std::forward<Args>(args))...};
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
}

inline void emit(const record &r)
{
    auto &g = global();
    std::time_t tt = std::chrono::system_clock::to_time_t(r.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::lock_guard lk(g.io_mtx);
    if (g.json.load(std::memory_order_relaxed)) {
        std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                  << level_name(r.lv) << "\",\"msg\":\"";
        for (char c : r.text) {
            if (c == '"' || c == '\\')
                std::cerr << '\\';
            std::cerr << c;
        }
        std::cerr << "\"}\n";
    } else {
        char buf[16];
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
        static constexpr char tags[] = {'D', 'I', 'W', 'E'};
        std::cerr << '[' << tags[static_cast<int>(r.lv)] << ' ' << buf << "] " << r.text << '\n';
    }
    std::cerr.flush();
}

inline void drain()
{
    auto &g = global();
    while (true) {
        std::deque<record> batch;
        {
            std::unique_lock lk(g.queue_mtx);
            g.queue_cv.wait(lk, [&] { return !g.running.load(std::memory_order_acquire) || !g.queue.empty(); });
            batch.swap(g.queue);
            if (batch.empty() && !g.running.load(std::memory_order_acquire))
                return;
        }
        for (auto &r : batch)
            emit(r);
    }
}

inline void stop()
{
    auto &g = global();
    if (!g.running.exchange(false, std::memory_order_acq_rel))
        return;
    g.queue_cv.notify_all();
    if (g.worker.joinable())
        g.worker.join();
}

inline void start()
{
    auto &g = global();
    if (g.started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("ARENA_LOG_LEVEL"))
        g.min_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("ARENA_LOG_JSON"))
        g.json.store(true, std::memory_order_relaxed);
    g.running.store(true, std::memory_order_release);
    g.worker = std::thread([] { drain(); });
    std::atexit([] { stop(); });
}

} // namespace detail

inline void init()
{
    detail::start();
}

// Flushes queued records and joins the writer; later calls write synchronously.
inline void shutdown()
{
    detail::stop();
}

inline void set_level(level lv) noexcept
{
    detail::global().min_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::global().min_level.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto &g = detail::global();
    detail::record r{lv, std::string(msg), std::chrono::system_clock::now()};
    if (!g.running.load(std::memory_order_acquire)) {
        detail::emit(r);
        return;
    }
    {
        std::lock_guard lk(g.queue_mtx);
        g.queue.push_back(std::move(r));
    }
    g.queue_cv.notify_one();
}

template <typename... Args>
inline void write(level lv, const char *fmt, Args &&...args)
{
    if (enabled(lv))
        write(lv, std::string_view(detail::format(fmt, std::forward<Args>(args)...)));
}

template <typename... Args>
inline void debug(const char *fmt, Args &&...args)
{
    write(level::debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(const char *fmt, Args &&...args)
{
    write(level::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(const char *fmt, Args &&...args)
{
    write(level::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(const char *fmt, Args &&...args)
{
    write(level::error, fmt, std::forward<Args>(args)...);
}

} // namespace arena::log
