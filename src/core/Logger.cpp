/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log to the console inline
#ifndef DEBUG

#include "core/Logger.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace Traverse {
namespace {

// Appends release-build log lines to <log dir>/traverse.log.
// The directory comes from TRAVERSE_LOG_DIR, falling back to the system temp dir.
class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(Logger::s_logMutex);

        if (!m_initialized) {
            initialize();
        }

        if (!m_fileStream.is_open()) {
            // No writable log location: fall back to stderr
            fprintf(stderr, "Traverse - [%s] %s: %s\n", system, level, message);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto timeNow = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;

        std::tm timeinfo{};
#ifdef _WIN32
        localtime_s(&timeinfo, &timeNow);
#else
        localtime_r(&timeNow, &timeinfo);
#endif

        m_fileStream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                     << std::setfill('0') << std::setw(3) << ms.count() << " ["
                     << level << "] [" << system << "] " << message << '\n';

        // CRITICAL lines must hit the disk before a possible crash
        if (std::strcmp(level, "CRITICAL") == 0) {
            m_fileStream.flush();
        }
    }

private:
    FileLogger() = default;

    ~FileLogger() {
        if (m_fileStream.is_open()) {
            m_fileStream.flush();
        }
    }

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void initialize() {
        m_initialized = true;

        namespace fs = std::filesystem;
        std::error_code ec;

        fs::path logDir;
        if (const char* envDir = std::getenv("TRAVERSE_LOG_DIR")) {
            logDir = envDir;
        } else {
            logDir = fs::temp_directory_path(ec) / "traverse";
            if (ec) {
                return;
            }
        }

        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        m_fileStream.open(logDir / "traverse.log", std::ios::out | std::ios::app);
    }

    std::ofstream m_fileStream;
    bool m_initialized = false;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}

} // namespace Traverse

#endif // ifndef DEBUG
