#pragma once

#include "fiscal/driver/ProtocolDriver.hpp"
#include "fiscal/protocol/ZfpCodec.hpp"

namespace fiscal::driver {

    /**
     * @brief Tremol compatible devices ("bg.zk.zfp")
     */
    class ZfpDriver : public ProtocolDriver {
    public:
        ZfpDriver(std::unique_ptr<transport::Channel> channel, DriverOptions options);

        std::pair<std::optional<double>, types::DeviceStatus> readCashAmount() override;

        std::pair<model::DeviceInfo, types::DeviceStatus> readDeviceInfo() override;

    protected:
        std::string name() const override {
            return "ZfpDriver";
        }

    private:
        protocol::ZfpCodec &zfp() {
            return static_cast<protocol::ZfpCodec &>(codec());
        }
    };

} // namespace fiscal::driver
