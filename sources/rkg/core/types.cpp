#include "rkg/types.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rkg {

    std::string format_timestamp(const Timestamp ts) {
        const auto time = std::chrono::system_clock::to_time_t(ts);
        std::tm tm{};
#ifdef _WIN32
        gmtime_s(&tm, &time);
#else
        gmtime_r(&time, &tm);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    Timestamp parse_timestamp(const std::string& text) {
        std::tm tm{};
        std::istringstream ss(text);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return Timestamp{};
        }

#ifdef _WIN32
        const std::time_t utc = _mkgmtime(&tm);
#else
        const std::time_t utc = timegm(&tm);
#endif
        auto result = std::chrono::system_clock::from_time_t(utc);

        // Skip fractional seconds, then apply any numeric offset.
        std::string rest;
        ss >> rest;
        std::size_t pos = 0;
        if (pos < rest.size() && rest[pos] == '.') {
            ++pos;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
                ++pos;
            }
        }
        const auto digit = [&rest](std::size_t i) {
            return std::isdigit(static_cast<unsigned char>(rest[i])) != 0;
        };
        if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-') && rest.size() >= pos + 6 &&
            digit(pos + 1) && digit(pos + 2) && digit(pos + 4) && digit(pos + 5)) {
            const int sign = rest[pos] == '+' ? 1 : -1;
            const int hours = std::stoi(rest.substr(pos + 1, 2));
            const int minutes = std::stoi(rest.substr(pos + 4, 2));
            result -= sign * (std::chrono::hours(hours) + std::chrono::minutes(minutes));
        }
        return result;
    }

}  // namespace rkg
