#include "fiscal/utils/DateTimeFormatter.hpp"

#include <chrono>
#include <cstring>
#include <iomanip>
#include <locale>
#include <sstream>

namespace fiscal::utils {

    DateTime makeDateTime(int year, int month, int day, int hour, int minute, int second) {
        DateTime dt{};
        dt.tm_year = year - 1900;
        dt.tm_mon = month - 1;
        dt.tm_mday = day;
        dt.tm_hour = hour;
        dt.tm_min = minute;
        dt.tm_sec = second;
        dt.tm_isdst = -1;
        return dt;
    }

    std::string formatDateTime(const DateTime &dateTime, const char *format) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::put_time(&dateTime, format);
        return oss.str();
    }

    std::optional<DateTime> parseDateTime(const std::string &text, const char *format) {
        DateTime dt{};
        std::istringstream iss(text);
        iss.imbue(std::locale::classic());
        iss >> std::get_time(&dt, format);
        if (iss.fail()) {
            return std::nullopt;
        }
        iss >> std::ws;
        if (iss.peek() != std::char_traits<char>::eof()) {
            return std::nullopt;
        }
        if (dt.tm_mon < 0 || dt.tm_mon > 11 || dt.tm_mday < 1 || dt.tm_mday > 31 ||
            dt.tm_hour > 23 || dt.tm_min > 59 || dt.tm_sec > 60) {
            return std::nullopt;
        }
        // two digit years are 20xx
        if (std::strstr(format, "%y") != nullptr && dt.tm_year < 69) dt.tm_year += 100;
        dt.tm_isdst = -1;
        return dt;
    }

    std::optional<DateTime> parseIsoDateTime(const std::string &text) {
        constexpr size_t ISO_LENGTH = 19;
        if (text.size() < ISO_LENGTH) return std::nullopt;
        return parseDateTime(text.substr(0, ISO_LENGTH), formats::Iso);
    }

    DateTime now() {
        auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        DateTime dt{};
        localtime_r(&t, &dt);
        return dt;
    }

    bool sameDateTime(const DateTime &a, const DateTime &b) {
        return a.tm_year == b.tm_year && a.tm_mon == b.tm_mon && a.tm_mday == b.tm_mday &&
               a.tm_hour == b.tm_hour && a.tm_min == b.tm_min && a.tm_sec == b.tm_sec;
    }

} // namespace fiscal::utils
