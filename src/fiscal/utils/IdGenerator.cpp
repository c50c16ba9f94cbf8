#include "fiscal/utils/IdGenerator.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace fiscal::utils {

    namespace {
        constexpr char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
        constexpr size_t ID_BYTES = 16;
    }

    std::string generateUrlSafeId() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dis(0, 255);

        std::array<uint8_t, ID_BYTES> bytes{};
        for (auto &b: bytes) {
            b = static_cast<uint8_t>(dis(gen));
        }

        std::string id;
        id.reserve(22);
        size_t i = 0;
        for (; i + 3 <= bytes.size(); i += 3) {
            uint32_t chunk = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
            id.push_back(ALPHABET[(chunk >> 18) & 0x3F]);
            id.push_back(ALPHABET[(chunk >> 12) & 0x3F]);
            id.push_back(ALPHABET[(chunk >> 6) & 0x3F]);
            id.push_back(ALPHABET[chunk & 0x3F]);
        }
        // 16 bytes leave one trailing byte: two symbols, no padding
        uint32_t last = bytes[i] << 16;
        id.push_back(ALPHABET[(last >> 18) & 0x3F]);
        id.push_back(ALPHABET[(last >> 12) & 0x3F]);
        return id;
    }

} // namespace fiscal::utils
