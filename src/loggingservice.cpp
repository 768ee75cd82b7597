// LoggingService.cpp
#include "loggingservice.hpp"
#include "logutils.hpp"
#include <filesystem>
#include <sstream>
#include <iomanip>

// Initialize static members
LoggingService* LoggingService::instance = nullptr;
std::mutex LoggingService::mutex;

LoggingService* LoggingService::getInstance(const std::string& serviceName,
                                          const std::string& logDir) {
    // Thread-safe initialization of singleton instance
    std::lock_guard<std::mutex> lock(mutex);
    if (instance == nullptr) {
        instance = new LoggingService(serviceName, logDir);
    }
    return instance;
}

LoggingService::LoggingService(const std::string& serviceName, const std::string& logDir)
    : serviceName(serviceName), logDirectory(logDir) {
    ensureLogDirectory();
    logFile = generateLogFilename();
    logStream.open(logFile, std::ios::app);  // Open in append mode
    if (!logStream.is_open()) {
        std::cerr << "Failed to open log file: " << logFile << std::endl;
    }
}

LoggingService::~LoggingService() {
    if (logStream.is_open()) {
        logStream.close();
    }
}

void LoggingService::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);
}

std::string LoggingService::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << logDirectory << "/"
       << serviceName << "_"
       << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S")
       << ".log";
    return ss.str();
}

std::string LoggingService::formatLog(LogLevel level, const std::string& message,
                                      const nlohmann::json& details, const std::string& eventCode) const {
    std::string timestamp = getCurrentTimestamp();
    std::string occurred = timestamp;
    std::string additionalInfo = "-";
    if (details.is_object() && !details.empty()) {
        nlohmann::json rest = details;
        auto it = rest.find("timestamp");
        if (it != rest.end() && it->is_string()) {
            occurred = it->get<std::string>();
            rest.erase(it);
        }
        if (!rest.empty()) {
            additionalInfo = rest.dump();
        }
    }
    return "LOG " + timestamp + " | " + levelToString.at(level) + " | " +
           occurred + " | " + message + " | " + additionalInfo + " | " + eventCode + "\n";
}

void LoggingService::log(LogLevel level, const std::string& message,
                         const nlohmann::json& details, const std::string& eventCode) {
    // Thread-safe logging operation
    std::lock_guard<std::mutex> lock(mutex);
    if (logStream.is_open()) {
        logStream << formatLog(level, message, details, eventCode);
        logStream.flush();  // Ensure immediate write to file
    }

    // Lower enum value means higher severity
    if (static_cast<int>(level) > static_cast<int>(consoleLevel)) {
        return;
    }
    std::ostream& console = (level == LogLevel::CRIT || level == LogLevel::ERROR) ? *consoleErr : *consoleOut;
    if (level == LogLevel::WARN) {
        console << "Warning: ";
    } else if (level == LogLevel::ERROR || level == LogLevel::CRIT) {
        console << "Error: ";
    }
    console << message;
    if (consoleLevel == LogLevel::DEBUG && details.is_object()) {
        nlohmann::json rest = details;
        rest.erase("timestamp");
        if (!rest.empty()) {
            console << " " << rest.dump();
        }
    }
    console << std::endl;
}

void LoggingService::progress(const ProgressReport& report) {
    std::lock_guard<std::mutex> lock(mutex);
    std::ostream& out = *consoleOut;
    out << std::fixed << std::setprecision(1)
        << "Progress: " << report.processed << "/" << report.totalFiles << " files ("
        << report.percentDone << "%) - " << std::setprecision(2) << report.filesPerSecond
        << " files/sec" << std::endl;
    if (report.previouslyProcessed > 0) {
        out << "  (" << report.previouslyProcessed << " previously processed, "
            << report.sessionProcessed << " in this session)" << std::endl;
    }
    if (report.hasEstimate) {
        out << "  Est. remaining: " << std::setprecision(1)
            << report.estimatedRemainingSeconds / 60.0 << " min" << std::endl;
    }
    out.unsetf(std::ios::floatfield);
}

void LoggingService::setConsoleLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex);
    consoleLevel = level;
}

void LoggingService::setConsoleStreams(std::ostream& out, std::ostream& err) {
    std::lock_guard<std::mutex> lock(mutex);
    consoleOut = &out;
    consoleErr = &err;
}
