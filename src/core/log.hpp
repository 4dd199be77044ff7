#pragma once

#include <functional>
#include <iostream>
#include <string>

namespace geoatlas::core {

// Logging callback type for load and configuration reporting
using LogCallback = std::function<void(const std::string& message, bool is_error)>;

inline void log_to_console(const std::string& message, bool is_error) {
    if (is_error) {
        std::cerr << message << std::endl;
    } else {
        std::cout << message << std::endl;
    }
}

inline LogCallback default_log_callback() {
    return &log_to_console;
}

} // namespace geoatlas::core
