#ifndef LOGUTILS_HPP
#define LOGUTILS_HPP

#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <string>
#include <nlohmann/json.hpp>

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// ISO-8601 local time with microseconds, used for every persisted *_at field
inline std::string getIsoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(6) << micros.count();
    return ss.str();
}

inline nlohmann::json createLogInfo(const nlohmann::json& additionalData = nlohmann::json()) {
    nlohmann::json info = additionalData.is_object() ? additionalData : nlohmann::json::object();
    info["timestamp"] = getCurrentTimestamp();
    return info;
}

#endif // LOGUTILS_HPP
