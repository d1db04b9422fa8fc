/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is off
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("read " + std::to_string(n) + " bytes", "Framer");
 */

#pragma once

#include "Logger.h"

#include <chrono>
#include <string>
#include <utility>

namespace Ferry {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::Ferry::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::Ferry::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::Ferry::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::Ferry::Logger::instance().error(msg, component)

// Logs elapsed wall time at DEBUG level on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name, std::string component = "Performance")
        : name_(std::move(name)), component_(std::move(component)),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::Ferry::ScopedTimer timer__(name, component)

} // namespace Ferry
