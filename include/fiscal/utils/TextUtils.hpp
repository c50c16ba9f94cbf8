#pragma once

#include <string>
#include <vector>

namespace fiscal::utils {

    /**
     * @brief Converts UTF-8 to Windows-1251, the code page Bulgarian fiscal devices print with.
     * Characters outside the code page become '?'.
     */
    std::string toWindows1251(const std::string &utf8);

    std::string withMaxLength(const std::string &text, size_t maxLength);

    std::string padRight(const std::string &text, size_t width, char fill = ' ');

    std::vector<std::string> split(const std::string &text, char delimiter);

    std::string trim(const std::string &text);

    std::string toLower(const std::string &text);

    std::string toHex(const std::string &bytes);

} // namespace fiscal::utils
