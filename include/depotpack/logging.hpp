#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace depotpack {

// Global mutex to keep stderr logs from multiple threads readable (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

// Writes "[tag] msg" as one line to stderr.
inline void log_line(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << "[" << tag << "] " << msg << "\n";
}

}  // namespace depotpack
