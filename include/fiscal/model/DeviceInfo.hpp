#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace fiscal::model {

    struct DeviceInfo {
        std::string uri;
        std::string serialNumber;
        std::string fiscalMemorySerialNumber;
        std::string manufacturer;
        std::string model;
        std::string firmwareVersion;
        int itemTextMaxLength = 0;
        int commentTextMaxLength = 0;
        int operatorPasswordMaxLength = 0;
    };

    inline void to_json(nlohmann::json &j, const DeviceInfo &info) {
        j = nlohmann::json{
                {"uri", info.uri},
                {"serialNumber", info.serialNumber},
                {"fiscalMemorySerialNumber", info.fiscalMemorySerialNumber},
                {"manufacturer", info.manufacturer},
                {"model", info.model},
                {"firmwareVersion", info.firmwareVersion},
                {"itemTextMaxLength", info.itemTextMaxLength},
                {"commentTextMaxLength", info.commentTextMaxLength},
                {"operatorPasswordMaxLength", info.operatorPasswordMaxLength}
        };
    }

} // namespace fiscal::model
