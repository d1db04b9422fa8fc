#pragma once

#include <string>
#include <mutex>
#include <atomic>
#include <fstream>
#include <iostream>
#include <optional>

namespace Ferry {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide logger writing to the console and an optional file
     *
     * Entries are formatted as "[time] [LEVEL] [Component] message". The log
     * file is rotated once it grows past the configured size.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);
        void setConsoleEnabled(bool enabled);

        bool isDebugEnabled() const { return currentLevel_.load() <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_.load() <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_.load(); }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        /**
         * @brief Parse "debug", "info", "warn", "error" or "critical" (any case)
         */
        static std::optional<LogLevel> parseLevel(const std::string& name);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "Ferry";
        bool consoleEnabled_ = true;
        size_t maxFileSizeMB_ = 50;
        size_t currentFileSize_ = 0;

        static std::string levelToString(LogLevel level);
        static std::string getCurrentTime();
        void rotateLogFile();
        size_t getFileSize() const;
    };

}
