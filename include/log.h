#ifndef LOG_H
#define LOG_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

// ==================== DEBUG LOGGING ====================
#ifndef CASTLINK_DEBUG_LOGGING
#define CASTLINK_DEBUG_LOGGING 1
#endif

inline std::string logTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local_tm;
    localtime_r(&time, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

#if CASTLINK_DEBUG_LOGGING
#define LOG(category, msg) \
    std::cout << "[" << logTimestamp() << "] [" << category << "] " << msg << std::endl
#define LOG_VAR(category, msg, var) \
    std::cout << "[" << logTimestamp() << "] [" << category << "] " << msg << var << std::endl
#else
#define LOG(category, msg)
#define LOG_VAR(category, msg, var)
#endif

#endif // LOG_H
