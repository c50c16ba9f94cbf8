#include "fiscal/driver/ZfpDriver.hpp"

#include "fiscal/types/Error.hpp"
#include "fiscal/utils/TextUtils.hpp"
#include "logger/Logger.hpp"

namespace fiscal::driver {

    ZfpDriver::ZfpDriver(std::unique_ptr<transport::Channel> channel, DriverOptions options)
        : ProtocolDriver(std::move(channel),
                         std::make_unique<protocol::ZfpCodec>(),
                         status::StatusDecoder(status::zfpStatusBits(), status::ZFP_STATUS_BYTES),
                         std::move(options)) {
    }

    std::pair<std::optional<double>, types::DeviceStatus> ZfpDriver::readCashAmount() {
        // 0x6E "0": <cash in>;<cash amount>;<cash out>...
        return parseCashAmount(request(codec().readCashAmount()), 1, 3);
    }

    std::pair<model::DeviceInfo, types::DeviceStatus> ZfpDriver::readDeviceInfo() {
        model::DeviceInfo info;
        info.manufacturer = "Tremol";
        info.itemTextMaxLength = static_cast<int>(protocol::zfp::ITEM_TEXT_MAX_LENGTH);
        info.commentTextMaxLength = static_cast<int>(protocol::zfp::COMMENT_TEXT_MAX_LENGTH);
        info.operatorPasswordMaxLength = 6;

        auto numbers = request(zfp().readFiscalDeviceNumbers());
        if (!numbers.status.ok()) {
            numbers.status.addInfo("Error occurred while reading device serial numbers");
            return {info, numbers.status};
        }
        auto fields = codec().splitFields(numbers.raw);
        if (fields.size() < 2) {
            numbers.status.addInfo("Error occurred while parsing device serial numbers");
            numbers.status.addError(types::codes::WrongFormat, "Wrong number of fields");
            return {info, numbers.status};
        }
        info.serialNumber = utils::trim(fields[0]);
        info.fiscalMemorySerialNumber = utils::trim(fields[1]);

        auto version = request(zfp().readVersion());
        if (!version.status.ok()) {
            version.status.addInfo("Error occurred while reading device version");
            return {info, version.status};
        }
        fields = codec().splitFields(version.raw);
        info.model = utils::trim(fields[0]);
        if (fields.size() > 1) {
            info.firmwareVersion = utils::trim(fields[1]);
        }

        Logger::logInfo("[ZfpDriver] Identified " + info.model + " " + info.serialNumber +
                        " (FM " + info.fiscalMemorySerialNumber + ")");
        return {info, version.status};
    }

} // namespace fiscal::driver
