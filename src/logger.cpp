/*
 * Adapted from nrvna ai - Asynchronous Inference Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) noexcept {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "error" || s == "critical") out = LogLevel::ERROR;
    else if (s == "warn" || s == "warning") out = LogLevel::WARN;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "trace") out = LogLevel::TRACE;
    else return false;
    return true;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&time_t, &tm);

        std::ostringstream ss;
        ss << "[" << std::put_time(&tm, "%y-%m-%d %H:%M:%S") << "]";
        ss << " [" << levelToString(level) << "] " << message;

        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (level <= LogLevel::WARN) {
            std::cerr << ss.str() << std::endl;
        } else {
            std::cout << ss.str() << std::endl;
        }
    } catch (const std::exception&) {
        // never throw from logging
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env = std::getenv("ENGINE_LOG_LEVEL");
    LogLevel parsed = LogLevel::INFO;
    if (env && parseLevel(env, parsed)) {
        return parsed;
    }
    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKNOWN";
}
