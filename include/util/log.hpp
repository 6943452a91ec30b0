#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace nx {

// Console logging in "[stage] message" form. Pipelines log from several
// threads at once, so whole lines are written under one mutex.
namespace log {

inline std::mutex& console_mutex() {
    static std::mutex m;
    return m;
}

inline void info(bool verbose, const std::string& stage, const std::string& message) {
    if (!verbose) return;
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cout << "[" << stage << "] " << message << "\n";
}

inline void warn(const std::string& stage, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << "[" << stage << "] Warning: " << message << std::endl;
}

inline void error(const std::string& stage, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << "[" << stage << "] Error: " << message << std::endl;
}

inline void progress(bool verbose, const std::string& stage, int current, int total,
                     const std::string& message = "") {
    if (!verbose || total <= 0) return;
    std::ostringstream line;
    line << "[" << stage << "] " << current << "/" << total;
    if (!message.empty()) {
        line << " - " << message;
    }
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cout << line.str() << "\n";
}

} // namespace log

} // namespace nx
