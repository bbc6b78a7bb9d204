/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds use inline definitions
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace Spacegame {
namespace {

class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void setDirectory(const std::string& directory) {
        std::lock_guard<std::mutex> lock(m_fileMutex);
        if (!m_initialized) {
            m_directory = directory;
        }
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_initialized) {
            initialize();
        }

        if (!m_fileStream.is_open()) {
            return;
        }

        // Format: YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm timeinfo{};
        localtime_r(&time_t_now, &timeinfo);

        m_fileStream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                     << std::setfill('0') << std::setw(3) << ms.count() << " ["
                     << level << "] [" << system << "] " << message << '\n';

        ++m_messageCount;

        // Flush on CRITICAL or every 50 messages
        if (std::strcmp(level, "CRITICAL") == 0 || m_messageCount >= 50) {
            m_fileStream.flush();
            m_messageCount = 0;
        }
    }

private:
    FileLogger() = default;

    ~FileLogger() {
        if (m_fileStream.is_open()) {
            m_fileStream.flush();
            m_fileStream.close();
        }
    }

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void initialize() {
        m_initialized = true;

        namespace fs = std::filesystem;
        fs::path logDir = fs::path(m_directory.empty() ? "." : m_directory) / "logs";

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return; // File logging disabled
        }

        cleanOldLogs(logDir, 5);

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm timeinfo{};
        localtime_r(&time_t_now, &timeinfo);

        std::ostringstream filename;
        filename << "spacegame_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
                 << ".log";

        fs::path logPath = logDir / filename.str();
        m_fileStream.open(logPath, std::ios::out | std::ios::app);

        if (m_fileStream.is_open()) {
            m_fileStream << "=== " << SPACEGAME_APP_NAME << " Log ===\n";
            m_fileStream << "Started: "
                         << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                         << "\n";
            m_fileStream
                << "==========================================\n\n";
            m_fileStream.flush();
        }
    }

    void cleanOldLogs(const std::filesystem::path& logDir, size_t keepCount) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logFiles;

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("spacegame_")) {
                logFiles.push_back(entry);
            }
        }

        if (logFiles.size() <= keepCount) {
            return;
        }

        // Oldest first
        std::sort(logFiles.begin(), logFiles.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });

        size_t toRemove = logFiles.size() - keepCount;
        for (size_t i = 0; i < toRemove; ++i) {
            fs::remove(logFiles[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_fileStream;
    std::string m_directory;
    bool m_initialized = false;
    size_t m_messageCount = 0;
};

} // anonymous namespace

void Logger::SetLogDirectory(const std::string& directory) {
    FileLogger::Instance().setDirectory(directory);
}

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

} // namespace Spacegame

#endif // ifndef DEBUG
