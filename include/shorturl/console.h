#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/console.h — Timestamped, colored console logging
// ═══════════════════════════════════════════════════════════════════
//
//    console::info("Listening on", host + ":" + std::to_string(port));
//    console::error("store append failed:", e.what());
//
//  Anything nlohmann::json can hold is printed as JSON.
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace shorturl::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

namespace detail {

struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

// Worker threads log concurrently; keep lines whole
inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    } else if constexpr (requires { nlohmann::json(arg).dump(); }) {
        return nlohmann::json(arg).dump();
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (level < threshold().load()) return;

    std::ostringstream line;
    line << Colors::Gray << "[" << timestamp() << "] "
         << color << prefix << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);

    std::lock_guard<std::mutex> lock(outputMutex());
    os << line.str() << std::endl;
}

} // namespace detail

inline void setLevel(Level level) { detail::threshold().store(level); }
inline Level level() { return detail::threshold().load(); }

// Accepts "debug", "info", "warn", "error", "silent"; anything else is Info
inline Level parseLevel(const std::string& name) {
    if (name == "debug")  return Level::Debug;
    if (name == "warn")   return Level::Warn;
    if (name == "error")  return Level::Error;
    if (name == "silent") return Level::Silent;
    return Level::Info;
}

template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

} // namespace shorturl::console
