#include "fiscal/types/DeviceStatus.hpp"

#include <algorithm>

namespace fiscal::types {

    std::string statusMessageTypeToString(StatusMessageType type) {
        switch (type) {
            case StatusMessageType::Info: return "info";
            case StatusMessageType::Warning: return "warning";
            case StatusMessageType::Error: return "error";
            case StatusMessageType::Reserved: return "reserved";
            default: return "unknown";
        }
    }

    bool DeviceStatus::ok() const {
        return std::none_of(messages_.begin(), messages_.end(), [](const StatusMessage &m) {
            return m.type == StatusMessageType::Error;
        });
    }

    void DeviceStatus::addInfo(const std::string &text) {
        messages_.push_back({StatusMessageType::Info, std::nullopt, text});
    }

    void DeviceStatus::addWarning(const std::string &code, const std::string &text) {
        messages_.push_back({StatusMessageType::Warning, code, text});
    }

    void DeviceStatus::addError(const std::string &code, const std::string &text) {
        messages_.push_back({StatusMessageType::Error, code, text});
    }

    void DeviceStatus::addError(const Error &error) {
        addError(error.code, error.message);
    }

    void DeviceStatus::addMessage(const StatusMessage &message) {
        if (message.type == StatusMessageType::Reserved) return;
        messages_.push_back(message);
    }

    void DeviceStatus::append(const DeviceStatus &other) {
        messages_.insert(messages_.end(), other.messages_.begin(), other.messages_.end());
    }

    bool DeviceStatus::hasMessage(const std::string &text) const {
        return std::any_of(messages_.begin(), messages_.end(), [&text](const StatusMessage &m) {
            return m.text == text;
        });
    }

    bool DeviceStatus::hasCode(const std::string &code) const {
        return std::any_of(messages_.begin(), messages_.end(), [&code](const StatusMessage &m) {
            return m.code && *m.code == code;
        });
    }

    bool DeviceStatus::operator==(const DeviceStatus &other) const {
        if (messages_.size() != other.messages_.size()) return false;
        for (size_t i = 0; i < messages_.size(); ++i) {
            const auto &a = messages_[i];
            const auto &b = other.messages_[i];
            if (a.type != b.type || a.code != b.code || a.text != b.text) return false;
        }
        return true;
    }

    void to_json(nlohmann::json &j, const StatusMessage &message) {
        j = nlohmann::json{
            {"type", statusMessageTypeToString(message.type)},
            {"text", message.text}
        };
        if (message.code) {
            j["code"] = *message.code;
        }
    }

    void to_json(nlohmann::json &j, const DeviceStatus &status) {
        j = nlohmann::json{
            {"ok", status.ok()},
            {"messages", status.messages()}
        };
    }

} // namespace fiscal::types
