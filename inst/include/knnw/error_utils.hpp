#ifndef KNNW_ERROR_UTILS_HPP_
#define KNNW_ERROR_UTILS_HPP_

#include "progress_utils.hpp"

#include <string>
#include <stdexcept>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <cstddef>

using std::size_t;

// Macro for location info
#define LOC_INFO __FILE__, __LINE__

namespace knnw {

inline std::string vformat_located(const char* file, int line, const char* format, va_list args) {
    constexpr size_t loc_size = 1024;
    constexpr size_t msg_size = 7168;
    char location[loc_size];
    char message[msg_size];

    int loc_len = std::snprintf(location, loc_size, "In %s (line %d): ", file, line);
    if (loc_len < 0) {
        location[0] = '\0';
    }

    int msg_len = std::vsnprintf(message, msg_size, format, args);
    if (msg_len < 0) {
        std::strncpy(message, "<unformattable message>", msg_size);
    }

    // vsnprintf truncates silently; the located prefix is always kept whole
    return std::string(location) + message;
}

/**
 * @brief Formats a located error message and throws it as std::runtime_error
 *
 * The message is prefixed with "In <file> (line <n>): " so that errors raised
 * deep inside I/O or neighbor search can be traced back from the CLI output.
 */
[[noreturn]] inline void report_error(const char* file, int line, const char* format, ...) {
    va_list args;
    va_start(args, format);
    std::string final_message = vformat_located(file, line, format, args);
    va_end(args);

    throw std::runtime_error(final_message);
}

// Wrapper macro for easier use
#define REPORT_ERROR(...) ::knnw::report_error(LOC_INFO, __VA_ARGS__)

// Warning reporting function
inline void report_warning(const char* file, int line, const char* format, ...) {
    va_list args;
    va_start(args, format);
    std::string final_message = vformat_located(file, line, format, args);
    va_end(args);

    final_message = "Warning: " + final_message + "\n";
    progress_write(final_message.c_str());
}

// Wrapper macro for warnings
#define REPORT_WARNING(...) ::knnw::report_warning(LOC_INFO, __VA_ARGS__)

// Vector bounds checking
template<typename T>
inline void check_index(T idx, T max, const char* file, int line, const char* var_name) {
    if (idx < 0 || idx >= max) {
        char message[512];
        std::snprintf(message, sizeof(message),
                      "In %s (line %d): Index out of bounds for '%s': %lld (valid range: 0 to %lld)",
                      file, line, var_name, (long long)idx, (long long)(max - 1));
        throw std::out_of_range(message);
    }
}

#define CHECK_INDEX(idx, max) ::knnw::check_index(idx, max, LOC_INFO, #idx)

} // namespace knnw

#endif // KNNW_ERROR_UTILS_HPP_
