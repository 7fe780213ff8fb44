// include/debug_utils.h
#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <iostream>
#include <mutex>

namespace nestkv {

// Keys and values are raw bytes; print them safely.
inline std::string format_key_for_print(std::string_view key) {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// For direct hex dump of a string's content
inline std::string hex_dump_string(std::string_view str) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : str) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

// C++17 fold expression over the stream; one line per call.
template<typename... Args>
void print_log_line(std::ostream& os, const char* tag, Args&&... args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    os << tag;
    (os << ... << std::forward<Args>(args));
    os << std::endl;
}

} // namespace nestkv

// --- Logging Macros ---

// #define NESTKV_DEBUG_LOG
// #define NESTKV_TRACE_LOG

#ifdef NESTKV_DEBUG_LOG
    #define LOG_DEBUG(...) do { ::nestkv::print_log_line(std::cout, "[DEBUG] ", __VA_ARGS__); } while(0)
#else
    #define LOG_DEBUG(...) do {} while(0)
#endif

#ifdef NESTKV_TRACE_LOG
    #define LOG_TRACE(...) do { ::nestkv::print_log_line(std::cout, "[TRACE] ", __VA_ARGS__); } while(0)
#else
    #define LOG_TRACE(...) do {} while(0)
#endif

#define LOG_INFO(...) do { ::nestkv::print_log_line(std::cout, "[INFO] ", __VA_ARGS__); } while(0)
#define LOG_WARN(...) do { ::nestkv::print_log_line(std::cerr, "[WARN] ", __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { ::nestkv::print_log_line(std::cerr, "[ERROR] ", __VA_ARGS__); } while(0)
#define LOG_FATAL(...) do { ::nestkv::print_log_line(std::cerr, "[FATAL] ", __VA_ARGS__); } while(0)
