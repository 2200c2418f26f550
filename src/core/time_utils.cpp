#include "quote_ngin/core/time_utils.hpp"
#include <regex>

namespace quote_ngin {
namespace core {

namespace {

std::time_t portable_timegm(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

}  // namespace

std::string to_rfc3339(const Timestamp& timestamp) {
    std::time_t seconds = static_cast<std::time_t>(to_unix_seconds(timestamp));
    std::tm time_info;
    if (safe_gmtime(&seconds, &time_info) == nullptr) {
        return "";
    }

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S+00:00", &time_info);
    return std::string(buffer);
}

Result<Timestamp> parse_rfc3339(const std::string& text) {
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(\.\d+)?([Zz]|[+-]\d{2}:\d{2})$)");

    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Not an RFC 3339 timestamp: '" + text + "'", "TimeUtils");
    }

    std::tm tm = {};
    tm.tm_year = std::stoi(match[1].str()) - 1900;
    tm.tm_mon = std::stoi(match[2].str()) - 1;
    tm.tm_mday = std::stoi(match[3].str());
    tm.tm_hour = std::stoi(match[4].str());
    tm.tm_min = std::stoi(match[5].str());
    tm.tm_sec = std::stoi(match[6].str());

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_hour > 23 ||
        tm.tm_min > 59 || tm.tm_sec > 60) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Date or time field out of range in '" + text + "'",
                                     "TimeUtils");
    }

    // Leap second: hold at :59 so timegm does not roll into the next day
    if (tm.tm_sec == 60) {
        tm.tm_sec = 59;
    }

    const int expected_mday = tm.tm_mday;
    const int expected_mon = tm.tm_mon;
    std::time_t seconds = portable_timegm(&tm);
    // timegm normalizes Feb 30 into March, which we reject
    if (tm.tm_mday != expected_mday || tm.tm_mon != expected_mon) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Day out of range for month in '" + text + "'",
                                     "TimeUtils");
    }

    const std::string zone = match[8].str();
    if (zone != "Z" && zone != "z") {
        int sign = zone[0] == '-' ? -1 : 1;
        int hours = std::stoi(zone.substr(1, 2));
        int minutes = std::stoi(zone.substr(4, 2));
        if (hours > 23 || minutes > 59) {
            return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                         "UTC offset out of range in '" + text + "'",
                                         "TimeUtils");
        }
        seconds -= sign * (hours * 3600 + minutes * 60);
    }

    std::chrono::microseconds fraction{0};
    if (match[7].matched) {
        std::string digits = match[7].str().substr(1);
        digits.resize(6, '0');
        fraction = std::chrono::microseconds(std::stol(digits));
    }

    return Result<Timestamp>(std::chrono::time_point_cast<Timestamp::duration>(
        std::chrono::system_clock::from_time_t(seconds) + fraction));
}

}  // namespace core
}  // namespace quote_ngin
