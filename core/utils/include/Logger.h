#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <atomic>
#include <cstddef>

namespace Tessera {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide logger
     *
     * Records look like "[2024-05-01 12:00:00] [INFO] [SignalingServer] message".
     * Console output is always on unless disabled; file output starts with
     * setLogFile() and rotates once the file passes the configured size.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        // Level checking for conditional logging (avoid string construction overhead)
        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        /// "debug", "info", "warn"/"warning", "error", "critical"; anything else maps to INFO
        static LogLevel parseLevel(const std::string& name);

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "Tessera";
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void writeEntry(const std::string& entry);
        void rotateLogFile();
        size_t getFileSize();
    };

}
