#pragma once

#include <stdexcept>
#include <string>

namespace fiscal::types {

    namespace codes {
        constexpr const char *TransportFailure = "E101";
        constexpr const char *SyntaxError = "E401";
        constexpr const char *InvalidArgument = "E403";
        constexpr const char *UnsupportedReversalReason = "E405";
        constexpr const char *UnsupportedPaymentType = "E406";
        constexpr const char *WrongFormat = "E409";
        constexpr const char *UnsupportedTaxGroup = "E411";
        constexpr const char *GeneralError = "E999";
    }

    class DriverException : public std::runtime_error {
    public:
        explicit DriverException(const std::string &msg)
            : std::runtime_error(msg) {
        }
    };

    class TransportException : public DriverException {
    public:
        explicit TransportException(const std::string &msg)
            : DriverException(msg) {
        }
    };

    class TimeoutException : public TransportException {
    public:
        TimeoutException() : TransportException("Timeout waiting for response") {
        }
    };

    class ChecksumMismatchException : public TransportException {
    public:
        ChecksumMismatchException() : TransportException("Checksum mismatch detected") {
        }
    };

    class ConnectionException : public DriverException {
    public:
        explicit ConnectionException(const std::string &msg)
            : DriverException(msg) {
        }
    };

} // namespace fiscal::types
