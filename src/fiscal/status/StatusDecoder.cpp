#include "fiscal/status/StatusDecoder.hpp"

#include <stdexcept>

#include "fiscal/types/Error.hpp"

namespace fiscal::status {

    StatusDecoder::StatusDecoder(StatusBitTable table, size_t byteCount, std::optional<size_t> switchByteIndex)
        : table_(std::move(table)), byteCount_(byteCount), switchByteIndex_(switchByteIndex) {
        if (table_.size() != byteCount_ * 8) {
            throw std::invalid_argument("Status bit table must have " + std::to_string(byteCount_ * 8) +
                                        " entries, got " + std::to_string(table_.size()));
        }
        if (switchByteIndex_ && *switchByteIndex_ >= byteCount_) {
            throw std::invalid_argument("Switch byte index out of range");
        }
    }

    types::DeviceStatus StatusDecoder::decode(const std::vector<uint8_t> &statusBytes) const {
        types::DeviceStatus status;
        if (statusBytes.size() != byteCount_) {
            status.addError(types::codes::WrongFormat,
                            "Wrong number of status bytes: expected " + std::to_string(byteCount_) +
                            ", got " + std::to_string(statusBytes.size()));
            return status;
        }

        for (size_t i = 0; i < statusBytes.size(); ++i) {
            uint8_t b = statusBytes[i];

            if (switchByteIndex_ && *switchByteIndex_ == i) {
                status.addInfo(describeSwitches(b));
                continue;
            }

            uint8_t mask = 0x80;
            for (int j = 0; j < 8; ++j) {
                if ((b & mask) != 0) {
                    const auto &bit = table_[i * 8 + (7 - j)];
                    if (bit.type != types::StatusMessageType::Reserved) {
                        status.addMessage({bit.type, bit.code, bit.text});
                    }
                }
                mask >>= 1;
            }
        }
        return status;
    }

    std::string StatusDecoder::describeSwitches(uint8_t value) {
        // Bit 7 is not a switch; bits 6..0 are SW7..SW1
        std::string text;
        uint8_t mask = 0x40;
        for (int sw = 7; sw >= 1; --sw) {
            if (!text.empty()) text += ", ";
            text += "SW" + std::to_string(sw) + "=" + ((value & mask) != 0 ? "ON" : "OFF");
            mask >>= 1;
        }
        return text;
    }

} // namespace fiscal::status
