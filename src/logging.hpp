#pragma once
// cmdbench - Diagnostic output

#include <cstdlib>
#include <iostream>
#include <string>

inline bool debug_enabled() {
    const char* env = std::getenv("CMDBENCH_DEBUG");
    return env && env[0] != '\0' && env[0] != '0';
}

inline void debug_log(const std::string& msg) {
    if (debug_enabled()) {
        std::cerr << "[debug] " << msg << "\n";
    }
}

inline void warn(const std::string& msg) {
    std::cerr << "Warning: " << msg << "\n";
}
