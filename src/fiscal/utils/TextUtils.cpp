#include "fiscal/utils/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace fiscal::utils {

    namespace {
        char cp1251FromCodePoint(uint32_t cp) {
            if (cp < 0x80) return static_cast<char>(cp);
            if (cp >= 0x0410 && cp <= 0x044F) return static_cast<char>(0xC0 + (cp - 0x0410));
            switch (cp) {
                case 0x0401: return static_cast<char>(0xA8); // Ё
                case 0x0451: return static_cast<char>(0xB8); // ё
                case 0x2116: return static_cast<char>(0xB9); // №
                case 0x00A0: return static_cast<char>(0xA0);
                case 0x00AB: return static_cast<char>(0xAB);
                case 0x00BB: return static_cast<char>(0xBB);
                case 0x2013: return static_cast<char>(0x96);
                case 0x2014: return static_cast<char>(0x97);
                case 0x20AC: return static_cast<char>(0x88);
                default: return '?';
            }
        }
    }

    std::string toWindows1251(const std::string &utf8) {
        std::string out;
        out.reserve(utf8.size());

        size_t i = 0;
        while (i < utf8.size()) {
            auto c = static_cast<unsigned char>(utf8[i]);
            uint32_t cp;
            size_t extra;
            if (c < 0x80) {
                cp = c;
                extra = 0;
            } else if ((c & 0xE0) == 0xC0) {
                cp = c & 0x1F;
                extra = 1;
            } else if ((c & 0xF0) == 0xE0) {
                cp = c & 0x0F;
                extra = 2;
            } else if ((c & 0xF8) == 0xF0) {
                cp = c & 0x07;
                extra = 3;
            } else {
                out.push_back('?');
                ++i;
                continue;
            }

            if (i + extra >= utf8.size()) {
                out.push_back('?');
                break;
            }

            bool valid = true;
            for (size_t k = 1; k <= extra; ++k) {
                auto cc = static_cast<unsigned char>(utf8[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }

            if (!valid) {
                out.push_back('?');
                ++i;
                continue;
            }

            out.push_back(cp1251FromCodePoint(cp));
            i += extra + 1;
        }
        return out;
    }

    std::string withMaxLength(const std::string &text, size_t maxLength) {
        return text.size() > maxLength ? text.substr(0, maxLength) : text;
    }

    std::string padRight(const std::string &text, size_t width, char fill) {
        if (text.size() >= width) return text;
        return text + std::string(width - text.size(), fill);
    }

    std::vector<std::string> split(const std::string &text, char delimiter) {
        std::vector<std::string> parts;
        std::string current;
        for (char c: text) {
            if (c == delimiter) {
                parts.push_back(current);
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        parts.push_back(current);
        return parts;
    }

    std::string trim(const std::string &text) {
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    std::string toLower(const std::string &text) {
        std::string result = text;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::string toHex(const std::string &bytes) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i > 0) oss << ' ';
            oss << std::setw(2) << static_cast<int>(static_cast<unsigned char>(bytes[i]));
        }
        return oss.str();
    }

} // namespace fiscal::utils
