#ifndef EVENTSINK_HPP
#define EVENTSINK_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Enumeration for different log levels following Syslog standard
 * Levels are arranged in descending order of severity
 */
enum class LogLevel {
    CRIT,   // Critical conditions
    ERROR,  // Error conditions
    WARN,   // Warning conditions
    INFO,   // Informational messages
    DEBUG   // Debug-level messages
};

/**
 * @brief Snapshot of conversion progress emitted after every terminal per-file outcome
 */
struct ProgressReport {
    std::size_t totalFiles = 0;
    std::size_t previouslyProcessed = 0;
    std::size_t sessionProcessed = 0;
    std::size_t processed = 0;          // previouslyProcessed + sessionProcessed
    double percentDone = 0.0;
    double filesPerSecond = 0.0;
    bool hasEstimate = false;           // set every 10 session files or every 1% of the total
    double estimatedRemainingSeconds = 0.0;
};

/**
 * @brief Observer injected into every component in place of ambient logging state
 *
 * Production code hands in the LoggingService; tests hand in a recording sink.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void log(LogLevel level, const std::string& message,
                     const nlohmann::json& details, const std::string& eventCode) = 0;

    virtual void progress(const ProgressReport& report) = 0;

    void critical(const std::string& message, const nlohmann::json& details = nlohmann::json::object(),
                  const std::string& eventCode = "-") {
        log(LogLevel::CRIT, message, details, eventCode);
    }
    void error(const std::string& message, const nlohmann::json& details = nlohmann::json::object(),
               const std::string& eventCode = "-") {
        log(LogLevel::ERROR, message, details, eventCode);
    }
    void warning(const std::string& message, const nlohmann::json& details = nlohmann::json::object(),
                 const std::string& eventCode = "-") {
        log(LogLevel::WARN, message, details, eventCode);
    }
    void info(const std::string& message, const nlohmann::json& details = nlohmann::json::object(),
              const std::string& eventCode = "-") {
        log(LogLevel::INFO, message, details, eventCode);
    }
    void debug(const std::string& message, const nlohmann::json& details = nlohmann::json::object(),
               const std::string& eventCode = "-") {
        log(LogLevel::DEBUG, message, details, eventCode);
    }
};

#endif // EVENTSINK_HPP
