#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fiscal/types/DeviceStatus.hpp"

namespace fiscal::status {

    struct StatusBit {
        std::optional<std::string> code;
        std::string text;
        types::StatusMessageType type;
    };

    // 8 entries per status byte, entry [byte * 8 + bit] describes bit (0 = least significant)
    using StatusBitTable = std::vector<StatusBit>;

    /**
     * @brief Turns the status bytes of a response into a DeviceStatus using a vendor bit table.
     *
     * Stateless: the same bytes always give the same DeviceStatus.
     */
    class StatusDecoder {
    public:
        StatusDecoder(StatusBitTable table, size_t byteCount,
                      std::optional<size_t> switchByteIndex = std::nullopt);

        types::DeviceStatus decode(const std::vector<uint8_t> &statusBytes) const;

        size_t byteCount() const {
            return byteCount_;
        }

    private:
        StatusBitTable table_;
        size_t byteCount_;
        std::optional<size_t> switchByteIndex_;

        static std::string describeSwitches(uint8_t value);
    };

    const StatusBitTable &zfpStatusBits();

    const StatusBitTable &islStatusBits();

    constexpr size_t ZFP_STATUS_BYTES = 7;
    constexpr size_t ISL_STATUS_BYTES = 6;
    constexpr size_t ISL_SWITCH_BYTE = 3;

} // namespace fiscal::status
