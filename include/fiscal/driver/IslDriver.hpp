#pragma once

#include "fiscal/driver/ProtocolDriver.hpp"
#include "fiscal/protocol/IslCodec.hpp"

namespace fiscal::driver {

    /**
     * @brief Datecs compatible devices ("bg.dt.isl")
     */
    class IslDriver : public ProtocolDriver {
    public:
        IslDriver(std::unique_ptr<transport::Channel> channel, DriverOptions options);

        std::pair<std::optional<double>, types::DeviceStatus> readCashAmount() override;

        std::pair<model::DeviceInfo, types::DeviceStatus> readDeviceInfo() override;

    protected:
        IslDriver(std::unique_ptr<transport::Channel> channel,
                  std::unique_ptr<protocol::IslCodec> codec,
                  DriverOptions options);

        std::string name() const override {
            return "IslDriver";
        }

        virtual std::string manufacturer() const {
            return "Datecs";
        }

    private:
        protocol::IslCodec &isl() {
            return static_cast<protocol::IslCodec &>(codec());
        }
    };

} // namespace fiscal::driver
