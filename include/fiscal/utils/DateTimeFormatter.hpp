#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace fiscal::utils {

    using DateTime = std::tm;

    namespace formats {
        constexpr const char *Iso = "%Y-%m-%dT%H:%M:%S";
        constexpr const char *ShortYear = "%d-%m-%y %H:%M:%S";
        constexpr const char *LongYearNoSeconds = "%d-%m-%Y %H:%M";
        constexpr const char *Qr = "%Y-%m-%d %H:%M:%S";
        constexpr const char *ReportDate = "%d%m%y";
        constexpr const char *DayMonth = "%d%m";
    }

    DateTime makeDateTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

    std::string formatDateTime(const DateTime &dateTime, const char *format);

    /**
     * @brief Parses text that must match the format completely; trailing characters fail the parse
     */
    std::optional<DateTime> parseDateTime(const std::string &text, const char *format);

    /**
     * @brief Accepts "yyyy-MM-ddTHH:mm:ss" optionally followed by fraction or zone suffix
     */
    std::optional<DateTime> parseIsoDateTime(const std::string &text);

    DateTime now();

    bool sameDateTime(const DateTime &a, const DateTime &b);

} // namespace fiscal::utils
