#pragma once

#include <cmath>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>

namespace fiscal::utils {
    constexpr int AMOUNT_PRECISION = 2;
    constexpr int QUANTITY_PRECISION = 3;

    /**
     * @brief Amount with exactly two decimals and '.' as separator, whatever the global locale
     */
    inline std::string formatAmount(double value) {
        double rounded = std::round(value * 100.0) / 100.0;
        if (std::fabs(rounded) < 0.005) rounded = 0.0;

        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::fixed << std::setprecision(AMOUNT_PRECISION) << rounded;
        return oss.str();
    }

    /**
     * @brief Quantity without padding: 2 -> "2", 1.5 -> "1.5", 0.125 -> "0.125"
     */
    inline std::string formatQuantity(double value) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::fixed << std::setprecision(QUANTITY_PRECISION) << value;
        std::string result = oss.str();

        // Rimuovi zeri finali
        size_t end = result.find_last_not_of('0');
        if (end != std::string::npos && result[end] == '.') end--;
        result = result.substr(0, end + 1);
        return result == "-0" ? "0" : result;
    }

    /**
     * @brief Strict parse: the whole text (surrounding spaces aside) must be a number
     */
    inline std::optional<double> parseAmount(const std::string &text) {
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::nullopt;
        size_t last = text.find_last_not_of(" \t\r\n");

        std::istringstream iss(text.substr(first, last - first + 1));
        iss.imbue(std::locale::classic());
        double value = 0.0;
        iss >> value;
        if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
            return std::nullopt;
        }
        return value;
    }
} // namespace fiscal::utils
