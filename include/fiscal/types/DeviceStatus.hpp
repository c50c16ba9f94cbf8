#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fiscal/types/Result.hpp"

namespace fiscal::types {

    enum class StatusMessageType {
        Info,
        Warning,
        Error,
        Reserved
    };

    std::string statusMessageTypeToString(StatusMessageType type);

    struct StatusMessage {
        StatusMessageType type = StatusMessageType::Info;
        std::optional<std::string> code;
        std::string text;
    };

    /**
     * @brief Messages gathered while talking to a device.
     *
     * ok() is derived: true as long as no Error message has been added.
     */
    class DeviceStatus {
    public:
        bool ok() const;

        void addInfo(const std::string &text);

        void addWarning(const std::string &code, const std::string &text);

        void addError(const std::string &code, const std::string &text);

        void addError(const Error &error);

        void addMessage(const StatusMessage &message);

        void append(const DeviceStatus &other);

        const std::vector<StatusMessage> &messages() const {
            return messages_;
        }

        bool hasMessage(const std::string &text) const;

        bool hasCode(const std::string &code) const;

        bool operator==(const DeviceStatus &other) const;

    private:
        std::vector<StatusMessage> messages_;
    };

    void to_json(nlohmann::json &j, const StatusMessage &message);

    void to_json(nlohmann::json &j, const DeviceStatus &status);

} // namespace fiscal::types
