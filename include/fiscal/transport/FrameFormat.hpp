#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace fiscal::transport {

    enum class FrameStatus {
        Incomplete,
        Complete,
        Busy
    };

    class FrameFormat {
    public:
        virtual ~FrameFormat() = default;

        /**
         * @brief Frames command bytes (opcode + data) with the next sequence number
         */
        virtual std::string wrap(const std::string &commandBytes) = 0;

        /**
         * @brief Looks for a complete response in buffer. On Complete the frame is
         * consumed from buffer and its data part stored in body. Throws
         * types::TransportException on NAK and types::ChecksumMismatchException
         * on a corrupted frame.
         */
        virtual FrameStatus extract(std::string &buffer, std::string &body) const = 0;
    };

    /**
     * @brief Datecs ISL: 01 LEN SEQ CMD DATA 05 BCC[4] 03
     */
    class IslFrameFormat : public FrameFormat {
    public:
        static constexpr uint8_t PRE = 0x01;
        static constexpr uint8_t PST = 0x05;
        static constexpr uint8_t EOT = 0x03;
        static constexpr uint8_t NAK = 0x15;
        static constexpr uint8_t SYN = 0x16;

        std::string wrap(const std::string &commandBytes) override;

        FrameStatus extract(std::string &buffer, std::string &body) const override;

    private:
        uint8_t sequence_ = 0x20;
    };

    /**
     * @brief Tremol ZFP: 02 LEN NBL CMD DATA CS[2] 0A
     */
    class ZfpFrameFormat : public FrameFormat {
    public:
        static constexpr uint8_t STX = 0x02;
        static constexpr uint8_t ETX = 0x0A;
        static constexpr uint8_t NAK = 0x15;
        static constexpr uint8_t RETRY = 0x0E;

        std::string wrap(const std::string &commandBytes) override;

        FrameStatus extract(std::string &buffer, std::string &body) const override;

    private:
        uint8_t sequence_ = 0x20;
    };

    std::unique_ptr<FrameFormat> makeFrameFormat(const std::string &protocol);

} // namespace fiscal::transport
