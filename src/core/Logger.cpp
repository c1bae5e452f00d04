/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds print to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <string_view>
#include <vector>

namespace PetDock {
namespace {

namespace fs = std::filesystem;

constexpr size_t KEPT_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;
constexpr std::string_view LOG_PREFIX = "petdock_";
constexpr std::string_view LOG_EXTENSION = ".log";

std::tm toLocalTime(std::time_t seconds) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    return local;
}

// 2025-03-14 09:26:53.589
std::string timestamp(std::chrono::system_clock::time_point now) {
    const std::tm t = toLocalTime(std::chrono::system_clock::to_time_t(now));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    return std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", t.tm_year + 1900, t.tm_mon + 1,
                       t.tm_mday, t.tm_hour, t.tm_min, t.tm_sec, ms);
}

// petdock_20250314_092653.log; names sort oldest first
std::string logFileName(std::chrono::system_clock::time_point now) {
    const std::tm t = toLocalTime(std::chrono::system_clock::to_time_t(now));
    return std::format("{}{:04}{:02}{:02}_{:02}{:02}{:02}{}", LOG_PREFIX, t.tm_year + 1900,
                       t.tm_mon + 1, t.tm_mday, t.tm_hour, t.tm_min, t.tm_sec, LOG_EXTENSION);
}

void pruneLogs(const fs::path& directory, size_t keep) {
    std::vector<fs::path> logs;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.starts_with(LOG_PREFIX) && entry.path().extension() == LOG_EXTENSION) {
            logs.push_back(entry.path());
        }
    }
    if (logs.size() <= keep) {
        return;
    }

    std::sort(logs.begin(), logs.end());
    const size_t excess = logs.size() - keep;
    for (size_t i = 0; i < excess; ++i) {
        fs::remove(logs[i], ec);
    }
}

/**
 * Release-build sink. The file is opened on the first message so a clean
 * run leaves nothing behind; if it cannot be opened, messages go to stderr.
 */
class LogFile {
public:
    static LogFile& Instance() {
        static LogFile instance;
        return instance;
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);

        const std::string line = std::format("{} [{}] [{}] {}\n",
                                             timestamp(std::chrono::system_clock::now()),
                                             level, system, message);
        if (!m_opened) {
            m_opened = true;
            open();
        }
        if (!m_stream.is_open()) {
            std::fputs(line.c_str(), stderr);
            return;
        }

        m_stream << line;
        const bool critical = std::string_view(level) == "CRITICAL";
        if (critical || ++m_unflushed >= FLUSH_EVERY) {
            m_stream.flush();
            m_unflushed = 0;
        }
    }

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

private:
    LogFile() = default;
    ~LogFile() = default;

    void open() {
        // PETDOCK_APP_NAME is defined via CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("PetDock", PETDOCK_APP_NAME);
        if (!prefPath) {
            return;
        }
        const fs::path directory = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            return;
        }
        // Leave room for the file about to be created
        pruneLogs(directory, KEPT_LOG_FILES - 1);

        const auto now = std::chrono::system_clock::now();
        m_stream.open(directory / logFileName(now), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << std::format("=== {} log, started {} ===\n\n", PETDOCK_APP_NAME, timestamp(now));
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened{false};
    size_t m_unflushed{0};
};

} // namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
        return;
    }
    LogFile::Instance().append(level, system, message);
}

} // namespace PetDock

#endif // DEBUG
