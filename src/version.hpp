#pragma once
// cmdbench - Version information


#include <string>
#include <sstream>

namespace version {

// Version numbers
constexpr int MAJOR = 1;
constexpr int MINOR = 3;
constexpr int PATCH = 0;

constexpr const char* VERSION_STRING = "1.3.0";

// Build date and time
constexpr const char* BUILD_DATE = __DATE__;
constexpr const char* BUILD_TIME = __TIME__;

inline std::string get_version_string() {
    return VERSION_STRING;
}

// Get compiler information for version output
inline std::string get_compiler_info() {
#if defined(_MSC_VER)
    std::ostringstream oss;
    oss << "MSVC " << _MSC_VER;
    return oss.str();
#elif defined(__clang__)
    std::ostringstream oss;
    oss << "Clang " << __clang_major__ << "." << __clang_minor__ << "." << __clang_patchlevel__;
    return oss.str();
#elif defined(__GNUC__)
    std::ostringstream oss;
    oss << "GCC " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__;
    return oss.str();
#else
    return "Unknown compiler";
#endif
}

// Format: "cmdbench X.Y.Z (built DATE TIME with COMPILER)"
inline std::string get_full_version_string() {
    std::ostringstream oss;
    oss << "cmdbench " << VERSION_STRING
        << " (built " << BUILD_DATE << " " << BUILD_TIME
        << " with " << get_compiler_info() << ")";
    return oss.str();
}

}
