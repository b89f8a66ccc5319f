#pragma once
#include <fstream>
#include <iostream>
#include <mutex>
#include <chrono>
#include <string>
#include <cstdlib>
#include <ctime>
#include <cstdio>

namespace Courier {

    enum class LogLevel { Debug = 0, Info, Warn, Error };

    inline LogLevel ParseLogLevel(const std::string& s, LogLevel fallback = LogLevel::Info) {
        if (s == "debug") return LogLevel::Debug;
        if (s == "info") return LogLevel::Info;
        if (s == "warn" || s == "warning") return LogLevel::Warn;
        if (s == "error") return LogLevel::Error;
        return fallback;
    }

    class Logger {
    public:
        static Logger& Instance() {
            static Logger instance;
            return instance;
        }

        bool Initialize(const std::string& filePath) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_File.is_open()) m_File.close();
            m_ShutdownDone = false;
            if (filePath.empty()) return true;
            m_File.open(filePath, std::ios::app);
            return m_File.is_open();
        }

        /// Mirror every line to stderr. COURIER_LOG_CONSOLE=1 turns it on regardless.
        void SetConsoleMirror(bool enabled) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Console = enabled || EnvConsoleRequested();
        }

        void SetLevel(LogLevel level) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Level = level;
        }

        void Log(LogLevel level, const char* prefix, const std::string& message) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (level < m_Level) return;
            if (!m_File.is_open() && !m_Console) return;

            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            struct tm localTime;
#ifdef _WIN32
            localtime_s(&localTime, &time);
#else
            localtime_r(&time, &localTime);
#endif
            char timeBuf[32];
            std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &localTime);
            char msBuf[8];
            std::snprintf(msBuf, sizeof(msBuf), ".%03d", static_cast<int>(ms.count()));

            if (m_File.is_open()) {
                m_File << timeBuf << msBuf << " [" << prefix << "] " << message << "\n";
                m_File.flush();
            }
            if (m_Console)
                std::cerr << timeBuf << msBuf << " [" << prefix << "] " << message << "\n";
        }

        void Shutdown() {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_ShutdownDone) return;
            m_ShutdownDone = true;
            if (m_File.is_open()) m_File.close();
        }

    private:
        Logger() : m_Console(EnvConsoleRequested()) {}
        ~Logger() { Shutdown(); }

        static bool EnvConsoleRequested() {
            const char* env = std::getenv("COURIER_LOG_CONSOLE");
            return env && (env[0] == '1' || env[0] == 'y' || env[0] == 'Y');
        }

        std::mutex m_Mutex;
        std::ofstream m_File;
        bool m_Console = false;
        LogLevel m_Level = LogLevel::Info;
        bool m_ShutdownDone = false;  // ~Logger() runs at process exit after an explicit Shutdown()
    };

    #define LOG_DEBUG(msg)      Courier::Logger::Instance().Log(Courier::LogLevel::Debug, "DEBUG", msg)
    #define LOG_INFO(msg)       Courier::Logger::Instance().Log(Courier::LogLevel::Info, "INFO", msg)
    #define LOG_WARN(msg)       Courier::Logger::Instance().Log(Courier::LogLevel::Warn, "WARN", msg)
    #define LOG_ERROR(msg)      Courier::Logger::Instance().Log(Courier::LogLevel::Error, "ERROR", msg)
    #define LOG_NETWORK(msg)    Courier::Logger::Instance().Log(Courier::LogLevel::Info, "Network", msg)
    #define LOG_SYNC(msg)       Courier::Logger::Instance().Log(Courier::LogLevel::Info, "Sync", msg)
}
