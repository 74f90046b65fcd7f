/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction below the active level
 *
 * Example:
 *   Logger::instance().debug("Chunk at " + std::to_string(offset), "DiffCopy");  // Always builds the string
 *   QS_LOG_DEBUG_COMP_IF("Chunk at " + std::to_string(offset), "DiffCopy");      // Only if debug enabled
 */

#pragma once

#include "Logger.h"
#include <chrono>

namespace QuietSync {

#define QS_LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::QuietSync::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define QS_LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::QuietSync::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define QS_LOG_ERROR_COMP(msg, component) ::QuietSync::Logger::instance().error(msg, component)

// Logs elapsed time at DEBUG when it goes out of scope
class ScopedTimer {
public:
    ScopedTimer(std::string name, std::string component)
        : name_(std::move(name)), component_(std::move(component)),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (!logger.isDebugEnabled()) return;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
        logger.debug(name_ + " took " + std::to_string(elapsed) + "ms", component_);
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define QS_SCOPED_TIMER_COMP(name, component) ::QuietSync::ScopedTimer timer__(name, component)

} // namespace QuietSync
