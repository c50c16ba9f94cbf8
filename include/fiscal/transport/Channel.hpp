#pragma once

#include <string>

namespace fiscal::transport {

/**
 * @brief Byte transport towards a fiscal device.
 *
 * send() takes the command bytes (opcode followed by payload) and receive()
 * returns the response body; any framing lives below this interface.
 * Failures are reported with types::TransportException.
 */
    class Channel {
    public:
        virtual ~Channel() = default;

        virtual void send(const std::string &bytes) = 0;

        virtual std::string receive() = 0;

        virtual bool isOpen() const = 0;
    };

} // namespace fiscal::transport
