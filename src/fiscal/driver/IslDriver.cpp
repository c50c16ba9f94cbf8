#include "fiscal/driver/IslDriver.hpp"

#include "fiscal/types/Error.hpp"
#include "fiscal/utils/TextUtils.hpp"
#include "logger/Logger.hpp"

namespace fiscal::driver {

    IslDriver::IslDriver(std::unique_ptr<transport::Channel> channel, DriverOptions options)
        : IslDriver(std::move(channel), std::make_unique<protocol::IslCodec>(), std::move(options)) {
    }

    IslDriver::IslDriver(std::unique_ptr<transport::Channel> channel,
                         std::unique_ptr<protocol::IslCodec> codec,
                         DriverOptions options)
        : ProtocolDriver(std::move(channel),
                         std::move(codec),
                         status::StatusDecoder(status::islStatusBits(), status::ISL_STATUS_BYTES,
                                               status::ISL_SWITCH_BYTE),
                         std::move(options)) {
    }

    std::pair<std::optional<double>, types::DeviceStatus> IslDriver::readCashAmount() {
        // money transfer of 0: <code>,<cash sum>,<served in>,<served out>
        return parseCashAmount(request(codec().readCashAmount()), 1, 2);
    }

    std::pair<model::DeviceInfo, types::DeviceStatus> IslDriver::readDeviceInfo() {
        model::DeviceInfo info;
        info.manufacturer = manufacturer();
        info.itemTextMaxLength = static_cast<int>(protocol::isl::ITEM_TEXT_MAX_LENGTH);
        info.commentTextMaxLength = static_cast<int>(protocol::isl::COMMENT_TEXT_MAX_LENGTH);
        info.operatorPasswordMaxLength = 8;

        auto response = request(isl().readDeviceInfo());
        if (!response.status.ok()) {
            response.status.addInfo("Error occurred while reading device info");
            return {info, response.status};
        }

        // <model>,<firmware>,<checksum>,<switches>,<serial>,<FM>
        auto fields = codec().splitFields(response.raw);
        if (fields.size() < 6) {
            response.status.addInfo("Error occurred while parsing device info");
            response.status.addError(types::codes::WrongFormat, "Wrong number of fields");
            return {info, response.status};
        }
        info.model = utils::trim(fields[0]);
        info.firmwareVersion = utils::trim(fields[1]);
        info.serialNumber = utils::trim(fields[4]);
        info.fiscalMemorySerialNumber = utils::trim(fields[5]);

        Logger::logInfo("[" + name() + "] Identified " + info.model + " " + info.serialNumber +
                        " (FM " + info.fiscalMemorySerialNumber + ")");
        return {info, response.status};
    }

} // namespace fiscal::driver
