#include "fiscal/transport/SerialChannel.hpp"
#include "fiscal/types/Error.hpp"
#include "fiscal/utils/TextUtils.hpp"
#include "logger/Logger.hpp"
#include <boost/system/error_code.hpp>
#include <stdexcept>

namespace fiscal::transport {
    // a device answering "busy" may keep the caller waiting this many read timeouts at most
    constexpr int MAX_BUSY_EXTENSIONS = 30;

    SerialChannel::SerialChannel(const std::string &portName, uint32_t baudrate,
                                 std::unique_ptr<FrameFormat> frameFormat,
                                 std::chrono::milliseconds readTimeout)
            : portName_(portName), io_context_(), serial_port_(nullptr),
              frameFormat_(std::move(frameFormat)), readTimeout_(readTimeout) {
        if (!frameFormat_) {
            throw std::invalid_argument("FrameFormat cannot be null");
        }
        try {
            serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_, portName);
            configurePort(baudrate);
            Logger::logInfo("[SerialChannel] Opened " + portName + " @ " + std::to_string(baudrate) + " baud");
        } catch (const boost::system::system_error &e) {
            Logger::logError("[SerialChannel] Failed to open " + portName + ": " + e.what());
            serial_port_.reset();
            throw types::ConnectionException("Cannot open serial port " + portName + ": " + e.what());
        }
    }

    SerialChannel::~SerialChannel() {
        if (serial_port_ && serial_port_->is_open()) {
            boost::system::error_code ec;
            serial_port_->close(ec);
            if (ec) {
                Logger::logError("[SerialChannel] Error closing port: " + ec.message());
            }
        }
    }

    void SerialChannel::configurePort(uint32_t baudrate) {
        boost::system::error_code ec;

        serial_port_->set_option(boost::asio::serial_port_base::baud_rate(baudrate), ec);
        if (ec) {
            Logger::logWarning("[SerialChannel] Failed to set baud rate: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialChannel] Failed to set character size: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::parity(
                boost::asio::serial_port_base::parity::none), ec);
        if (ec) {
            Logger::logWarning("[SerialChannel] Failed to set parity: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::stop_bits(
                boost::asio::serial_port_base::stop_bits::one), ec);
        if (ec) {
            Logger::logWarning("[SerialChannel] Failed to set stop bits: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::flow_control(
                boost::asio::serial_port_base::flow_control::none), ec);
        if (ec) {
            Logger::logWarning("[SerialChannel] Failed to set flow control: " + ec.message());
        }
    }

    bool SerialChannel::isOpen() const {
        return serial_port_ && serial_port_->is_open();
    }

    void SerialChannel::send(const std::string &bytes) {
        if (!isOpen()) {
            throw types::TransportException("Serial port " + portName_ + " is not open");
        }

        // stale bytes from an earlier exchange must not be taken as this response
        buffer_.clear();
        std::string frame = frameFormat_->wrap(bytes);

        boost::system::error_code ec;
        size_t written = boost::asio::write(*serial_port_, boost::asio::buffer(frame), ec);
        if (ec) {
            Logger::logError("[SerialChannel] Write error: " + ec.message());
            throw types::TransportException("Write error on " + portName_ + ": " + ec.message());
        }
        if (written != frame.size()) {
            throw types::TransportException("Not all bytes written: " + std::to_string(written) + "/" +
                                            std::to_string(frame.size()));
        }
        Logger::logInfo("[SerialChannel] TX " + utils::toHex(frame));
    }

    std::string SerialChannel::receive() {
        if (!isOpen()) {
            throw types::TransportException("Serial port " + portName_ + " is not open");
        }

        auto deadline = std::chrono::steady_clock::now() + readTimeout_;
        int busyExtensions = 0;
        char temp[256];

        while (true) {
            std::string body;
            FrameStatus frameStatus = frameFormat_->extract(buffer_, body);
            if (frameStatus == FrameStatus::Complete) {
                Logger::logInfo("[SerialChannel] RX " + utils::toHex(body));
                return body;
            }
            if (frameStatus == FrameStatus::Busy && busyExtensions < MAX_BUSY_EXTENSIONS) {
                ++busyExtensions;
                deadline = std::chrono::steady_clock::now() + readTimeout_;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                Logger::logWarning("[SerialChannel] Timeout waiting for response on " + portName_);
                throw types::TimeoutException();
            }

            size_t n = readSome(temp, sizeof(temp), remaining);
            buffer_.append(temp, n);
        }
    }

    size_t SerialChannel::readSome(char *data, size_t size, std::chrono::milliseconds timeout) {
        boost::system::error_code readError = boost::asio::error::would_block;
        size_t bytesRead = 0;

        io_context_.restart();
        serial_port_->async_read_some(boost::asio::buffer(data, size),
                                      [&readError, &bytesRead](const boost::system::error_code &ec, size_t n) {
                                          readError = ec;
                                          bytesRead = n;
                                      });
        io_context_.run_for(timeout);

        if (!io_context_.stopped()) {
            // timed out: cancel and let the handler observe operation_aborted
            boost::system::error_code cancelError;
            serial_port_->cancel(cancelError);
            io_context_.run();
            return readError ? 0 : bytesRead;
        }

        if (readError) {
            throw types::TransportException("Read error on " + portName_ + ": " + readError.message());
        }
        return bytesRead;
    }
} // namespace fiscal::transport
