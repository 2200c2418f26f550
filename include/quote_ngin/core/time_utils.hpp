#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <string>
#include "quote_ngin/core/error.hpp"
#include "quote_ngin/core/types.hpp"

namespace quote_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as RFC 3339 in UTC with second precision
 *
 * Output looks like "2024-03-01T14:30:00+00:00".
 */
std::string to_rfc3339(const Timestamp& timestamp);

/**
 * @brief Parse an RFC 3339 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)". The date/time
 * separator may also be a lowercase 't' or a single space.
 *
 * @return The UTC instant, or INVALID_ARGUMENT when the text is malformed
 */
Result<Timestamp> parse_rfc3339(const std::string& text);

/**
 * @brief Seconds since the Unix epoch
 */
inline int64_t to_unix_seconds(const Timestamp& timestamp) {
    return std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count();
}

inline Timestamp from_unix_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

}  // namespace core
}  // namespace quote_ngin
