/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string_view>
#include <vector>

#ifndef WAYFARER_APP_NAME
#define WAYFARER_APP_NAME "Wayfarer"
#endif

namespace Wayfarer {
namespace {

namespace fs = std::filesystem;

constexpr size_t kKeptLogFiles = 5;
constexpr size_t kFlushEvery = 50;
constexpr std::string_view kLogPrefix = "wayfarer_";

std::tm localNow(std::chrono::system_clock::time_point now) {
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &seconds);
#else
    localtime_r(&seconds, &timeinfo);
#endif
    return timeinfo;
}

// Session log under the SDL pref path, one file per run
class SessionLog {
public:
    static SessionLog& Instance() {
        static SessionLog instance;
        return instance;
    }

    void append(std::string_view level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_opened) {
            open();
        }
        if (!m_out.is_open()) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const std::tm timeinfo = localNow(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch()).count() % 1000;

        m_out << std::put_time(&timeinfo, "%H:%M:%S") << '.' << std::setfill('0')
              << std::setw(3) << millis << ' ' << level << " [" << system << "] "
              << message << '\n';

        if (level == "CRITICAL" || ++m_pending >= kFlushEvery) {
            m_out.flush();
            m_pending = 0;
        }
    }

private:
    SessionLog() = default;
    ~SessionLog() {
        if (m_out.is_open()) {
            m_out.flush();
        }
    }

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    void open() {
        m_opened = true;

        char* prefPath = SDL_GetPrefPath("Wayfarer", WAYFARER_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        const fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneOldLogs(logDir);

        const std::tm started = localNow(std::chrono::system_clock::now());
        std::ostringstream name;
        name << kLogPrefix << std::put_time(&started, "%Y%m%d_%H%M%S") << ".log";

        m_out.open(logDir / name.str(), std::ios::out | std::ios::app);
        if (m_out.is_open()) {
            m_out << "=== " << WAYFARER_APP_NAME << " session "
                  << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << " ===\n";
        }
    }

    // Keeps the newest kKeptLogFiles - 1 so the new session makes kKeptLogFiles
    static void pruneOldLogs(const fs::path& logDir) {
        std::vector<fs::path> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            const std::string filename = entry.path().filename().string();
            if (entry.path().extension() == ".log" && filename.starts_with(kLogPrefix)) {
                logs.push_back(entry.path());
            }
        }
        if (logs.size() < kKeptLogFiles) {
            return;
        }

        // Timestamped names sort oldest first
        std::sort(logs.begin(), logs.end());
        const size_t excess = logs.size() - (kKeptLogFiles - 1);
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i], ec);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_out;
    bool m_opened{false};
    size_t m_pending{0};
};

} // namespace

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    SessionLog::Instance().append(level, system, message);
}

} // namespace Wayfarer

#endif // ifndef DEBUG
