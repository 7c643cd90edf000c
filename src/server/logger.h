#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace zxcompile {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    static void SetLevel(LogLevel level) { min_level_.store(level); }
    static LogLevel Level() { return min_level_.load(); }

    // Accepts "debug", "info", "warn"/"warning" and "error". Returns false and
    // leaves the level untouched for anything else.
    static bool SetLevel(const std::string& name) {
        if (name == "debug") {
            SetLevel(LogLevel::DEBUG);
        } else if (name == "info") {
            SetLevel(LogLevel::INFO);
        } else if (name == "warn" || name == "warning") {
            SetLevel(LogLevel::WARNING);
        } else if (name == "error") {
            SetLevel(LogLevel::ERROR);
        } else {
            return false;
        }
        return true;
    }

    static void Log(LogLevel level, const std::string& message) {
        if (level < min_level_.load()) return;

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
        out << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "[DEBUG] "; break;
            case LogLevel::INFO: out << "[INFO] "; break;
            case LogLevel::WARNING: out << "[WARN] "; break;
            case LogLevel::ERROR: out << "[ERROR] "; break;
        }

        out << message << std::endl;
    }

    template<typename... Args>
    static void Debug(Args... args) {
        if (LogLevel::DEBUG < min_level_.load()) return;
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void Info(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void Warn(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::WARNING, ss.str());
    }

    template<typename... Args>
    static void Error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::ERROR, ss.str());
    }

private:
    static std::mutex mutex_;
    static std::atomic<LogLevel> min_level_;
};

inline std::mutex Logger::mutex_;
inline std::atomic<LogLevel> Logger::min_level_{LogLevel::INFO};

} // namespace zxcompile
