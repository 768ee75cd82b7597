#pragma once
#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <map>
#include <mutex>
#include "eventsink.hpp"

/**
 * @brief Thread-safe singleton logging service class
 *
 * This class implements a singleton pattern for logging, ensuring that only
 * one instance of the logger exists across the entire application. Every entry
 * goes to a timestamped log file; entries at or above the console threshold are
 * mirrored to the terminal in a shorter form.
 */
class LoggingService : public EventSink {
private:
    // Singleton instance pointer and mutex for thread safety
    static LoggingService* instance;
    static std::mutex mutex;

    // Core member variables
    std::string serviceName;    // Name of the service using the logger
    std::string logDirectory;   // Directory where log files are stored
    std::string logFile;        // Current log file path
    std::ofstream logStream;    // Output stream for writing logs
    LogLevel consoleLevel = LogLevel::INFO;
    std::ostream* consoleOut = &std::cout;
    std::ostream* consoleErr = &std::cerr;

    /**
     * @brief Mapping of LogLevel enum to human-readable strings
     * Used for formatting log messages
     */
    const std::map<LogLevel, std::string> levelToString = {
        {LogLevel::CRIT, "CRIT"}, {LogLevel::ERROR, "ERROR"},
        {LogLevel::WARN, "WARN"},
        {LogLevel::INFO, "INFO"}, {LogLevel::DEBUG, "DEBUG"}
    };

    /**
     * @brief Creates log directory if it doesn't exist
     */
    void ensureLogDirectory();

    /**
     * @brief Generates a unique log filename using service name and timestamp
     * @return String containing the generated filename
     */
    std::string generateLogFilename();

protected:
    /**
     * @brief Constructor, reached through getInstance()
     * @param serviceName Name of the service using the logger
     * @param logDir Directory where log files will be stored
     */
    LoggingService(const std::string& serviceName, const std::string& logDir = "logs");

public:
    // Prevent copying and assignment
    LoggingService(const LoggingService&) = delete;
    LoggingService& operator=(const LoggingService&) = delete;

    /**
     * @brief Destructor ensures log stream is properly closed
     */
    ~LoggingService() override;

    /**
     * @brief Gets singleton instance of the logger
     * If instance doesn't exist, creates it. If it exists, returns existing instance.
     * @param serviceName Name of the service (only used when creating new instance)
     * @param logDir Log directory (only used when creating new instance)
     * @return Pointer to the singleton logger instance
     */
    static LoggingService* getInstance(const std::string& serviceName = "DefaultService",
                                     const std::string& logDir = "logs");

    /**
     * @brief Formats log message according to specified format
     * Format: LOG TIMESTAMP | LOG LEVEL | OCCURRENCE TIMESTAMP | MESSAGE | ADDITIONAL INFO | EVENT CODE
     */
    std::string formatLog(LogLevel level, const std::string& message,
                          const nlohmann::json& details, const std::string& eventCode) const;

    /**
     * @brief Core logging function used by all severity levels
     * @param level Severity level of the log
     * @param message Main log message
     * @param details Structured context; its "timestamp" is used as the occurrence time
     * @param eventCode Short code identifying the event
     */
    void log(LogLevel level, const std::string& message,
             const nlohmann::json& details, const std::string& eventCode) override;

    void progress(const ProgressReport& report) override;

    // Entries less severe than level are written to the file only
    void setConsoleLevel(LogLevel level);

    void setConsoleStreams(std::ostream& out, std::ostream& err);

    const std::string& getLogFile() const { return logFile; }
};
