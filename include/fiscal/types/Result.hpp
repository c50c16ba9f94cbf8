#pragma once

#include <string>
#include <utility>
#include <variant>

namespace fiscal::types {

    enum class ErrorKind {
        ProtocolSyntaxError,
        UnsupportedValue,
        InvalidArgument,
        DeviceError,
        TransportFailure
    };

    inline std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::ProtocolSyntaxError: return "ProtocolSyntaxError";
            case ErrorKind::UnsupportedValue: return "UnsupportedValue";
            case ErrorKind::InvalidArgument: return "InvalidArgument";
            case ErrorKind::DeviceError: return "DeviceError";
            case ErrorKind::TransportFailure: return "TransportFailure";
            default: return "Unknown";
        }
    }

    struct Error {
        ErrorKind kind;
        std::string code;
        std::string message;
    };

    /**
     * @brief Value or Error. Used by the codecs so that mapping failures
     * travel back to the caller as values instead of exceptions.
     */
    template<typename T>
    class Result {
    public:
        static inline Result success(T value) {
            return Result(std::move(value));
        }

        static inline Result failure(Error error) {
            return Result(std::move(error));
        }

        static inline Result failure(ErrorKind kind, const std::string &code, const std::string &message) {
            return Result(Error{kind, code, message});
        }

        inline bool isSuccess() const {
            return std::holds_alternative<T>(data_);
        }

        inline bool isError() const {
            return std::holds_alternative<Error>(data_);
        }

        const T &value() const {
            return std::get<T>(data_);
        }

        T &value() {
            return std::get<T>(data_);
        }

        const Error &error() const {
            return std::get<Error>(data_);
        }

    private:
        explicit Result(T value) : data_(std::move(value)) {
        }

        explicit Result(Error error) : data_(std::move(error)) {
        }

        std::variant<T, Error> data_;
    };

} // namespace fiscal::types
