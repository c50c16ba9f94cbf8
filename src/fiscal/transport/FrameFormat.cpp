#include "fiscal/transport/FrameFormat.hpp"

#include <stdexcept>

#include "fiscal/types/Error.hpp"

namespace fiscal::transport {

    namespace {
        constexpr uint8_t LENGTH_OFFSET = 0x20;

        uint8_t byteAt(const std::string &s, size_t i) {
            return static_cast<uint8_t>(s[i]);
        }

        void appendNibbles(std::string &out, uint32_t value, int count) {
            for (int shift = (count - 1) * 4; shift >= 0; shift -= 4) {
                out.push_back(static_cast<char>(((value >> shift) & 0x0F) + 0x30));
            }
        }

        // Drops noise before the first occurrence of start; NAK or busy markers seen
        // on the way are reported through the flags.
        size_t skipToStart(std::string &buffer, uint8_t start, uint8_t nak, uint8_t busy,
                           bool &sawNak, bool &sawBusy) {
            size_t pos = 0;
            while (pos < buffer.size() && byteAt(buffer, pos) != start) {
                if (byteAt(buffer, pos) == nak) sawNak = true;
                if (byteAt(buffer, pos) == busy) sawBusy = true;
                ++pos;
            }
            buffer.erase(0, pos);
            return buffer.size();
        }
    }

    std::string IslFrameFormat::wrap(const std::string &commandBytes) {
        if (commandBytes.empty()) {
            throw types::TransportException("Command bytes cannot be empty");
        }
        size_t dataLength = commandBytes.size() - 1;
        if (LENGTH_OFFSET + 4 + dataLength > 0xFF) {
            throw types::TransportException("Command data too long for one frame");
        }

        std::string frame;
        frame.push_back(static_cast<char>(PRE));
        frame.push_back(static_cast<char>(LENGTH_OFFSET + 4 + dataLength));
        frame.push_back(static_cast<char>(sequence_));
        frame += commandBytes;
        frame.push_back(static_cast<char>(PST));

        uint32_t sum = 0;
        for (size_t i = 1; i < frame.size(); ++i) {
            sum += byteAt(frame, i);
        }
        appendNibbles(frame, sum, 4);
        frame.push_back(static_cast<char>(EOT));

        sequence_ = sequence_ >= 0x7F ? 0x20 : static_cast<uint8_t>(sequence_ + 1);
        return frame;
    }

    FrameStatus IslFrameFormat::extract(std::string &buffer, std::string &body) const {
        bool sawNak = false;
        bool sawBusy = false;
        size_t available = skipToStart(buffer, PRE, NAK, SYN, sawNak, sawBusy);
        if (sawNak) {
            throw types::TransportException("Device rejected the frame (NAK)");
        }
        if (available < 2) {
            return sawBusy ? FrameStatus::Busy : FrameStatus::Incomplete;
        }

        if (byteAt(buffer, 1) < LENGTH_OFFSET + 4) {
            buffer.erase(0, 1);
            throw types::TransportException("Invalid frame length");
        }
        size_t postambleIndex = byteAt(buffer, 1) - LENGTH_OFFSET;
        size_t frameLength = postambleIndex + 6;
        if (available < frameLength) {
            return FrameStatus::Incomplete;
        }
        if (byteAt(buffer, postambleIndex) != PST || byteAt(buffer, frameLength - 1) != EOT) {
            buffer.erase(0, frameLength);
            throw types::TransportException("Malformed frame");
        }

        uint32_t sum = 0;
        for (size_t i = 1; i <= postambleIndex; ++i) {
            sum += byteAt(buffer, i);
        }
        std::string expected;
        appendNibbles(expected, sum, 4);
        if (buffer.compare(postambleIndex + 1, 4, expected) != 0) {
            buffer.erase(0, frameLength);
            throw types::ChecksumMismatchException();
        }

        body = buffer.substr(4, postambleIndex - 4);
        buffer.erase(0, frameLength);
        return FrameStatus::Complete;
    }

    std::string ZfpFrameFormat::wrap(const std::string &commandBytes) {
        if (commandBytes.empty()) {
            throw types::TransportException("Command bytes cannot be empty");
        }
        size_t dataLength = commandBytes.size() - 1;
        if (LENGTH_OFFSET + 3 + dataLength > 0xFF) {
            throw types::TransportException("Command data too long for one frame");
        }

        std::string frame;
        frame.push_back(static_cast<char>(STX));
        frame.push_back(static_cast<char>(LENGTH_OFFSET + 3 + dataLength));
        frame.push_back(static_cast<char>(sequence_));
        frame += commandBytes;

        uint8_t checksum = 0;
        for (size_t i = 1; i < frame.size(); ++i) {
            checksum ^= byteAt(frame, i);
        }
        appendNibbles(frame, checksum, 2);
        frame.push_back(static_cast<char>(ETX));

        sequence_ = sequence_ == 0xFF ? 0x20 : static_cast<uint8_t>(sequence_ + 1);
        return frame;
    }

    FrameStatus ZfpFrameFormat::extract(std::string &buffer, std::string &body) const {
        bool sawNak = false;
        bool sawRetry = false;
        size_t available = skipToStart(buffer, STX, NAK, RETRY, sawNak, sawRetry);
        if (sawNak) {
            throw types::TransportException("Device rejected the frame (NAK)");
        }
        if (available < 2) {
            return sawRetry ? FrameStatus::Busy : FrameStatus::Incomplete;
        }

        if (byteAt(buffer, 1) < LENGTH_OFFSET + 3) {
            buffer.erase(0, 1);
            throw types::TransportException("Invalid frame length");
        }
        size_t lastDataIndex = byteAt(buffer, 1) - LENGTH_OFFSET;
        size_t frameLength = lastDataIndex + 4;
        if (available < frameLength) {
            return FrameStatus::Incomplete;
        }
        if (byteAt(buffer, frameLength - 1) != ETX) {
            buffer.erase(0, frameLength);
            throw types::TransportException("Malformed frame");
        }

        uint8_t checksum = 0;
        for (size_t i = 1; i <= lastDataIndex; ++i) {
            checksum ^= byteAt(buffer, i);
        }
        std::string expected;
        appendNibbles(expected, checksum, 2);
        if (buffer.compare(lastDataIndex + 1, 2, expected) != 0) {
            buffer.erase(0, frameLength);
            throw types::ChecksumMismatchException();
        }

        body = buffer.substr(4, lastDataIndex - 3);
        buffer.erase(0, frameLength);
        return FrameStatus::Complete;
    }

    std::unique_ptr<FrameFormat> makeFrameFormat(const std::string &protocol) {
        if (protocol == "zfp") {
            return std::make_unique<ZfpFrameFormat>();
        }
        if (protocol == "isl") {
            return std::make_unique<IslFrameFormat>();
        }
        throw std::invalid_argument("Unknown frame format: " + protocol);
    }

} // namespace fiscal::transport
