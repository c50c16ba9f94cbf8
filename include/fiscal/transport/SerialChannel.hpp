#pragma once

#include "fiscal/transport/Channel.hpp"
#include "fiscal/transport/FrameFormat.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <string>
#include <memory>

namespace fiscal::transport {

/**
 * @brief Channel over a serial port using Boost.Asio, framed by a vendor FrameFormat
 */
    class SerialChannel : public Channel {
    public:
        SerialChannel(const std::string &portName, uint32_t baudrate,
                      std::unique_ptr<FrameFormat> frameFormat,
                      std::chrono::milliseconds readTimeout);

        ~SerialChannel() override;

        void send(const std::string &bytes) override;

        std::string receive() override;

        bool isOpen() const override;

    private:
        std::string portName_;
        boost::asio::io_context io_context_;
        std::unique_ptr<boost::asio::serial_port> serial_port_;
        std::unique_ptr<FrameFormat> frameFormat_;
        std::chrono::milliseconds readTimeout_;
        std::string buffer_;

        void configurePort(uint32_t baudrate);

        /**
         * @brief Reads what is available within timeout; 0 means the timeout expired
         */
        size_t readSome(char *data, size_t size, std::chrono::milliseconds timeout);
    };

} // namespace fiscal::transport
