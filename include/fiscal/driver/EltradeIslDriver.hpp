#pragma once

#include "fiscal/driver/IslDriver.hpp"

namespace fiscal::driver {

    /**
     * @brief Eltrade devices ("bg.ed.isl"); receipts are opened with the operator name
     */
    class EltradeIslDriver : public IslDriver {
    public:
        EltradeIslDriver(std::unique_ptr<transport::Channel> channel, DriverOptions options);

    protected:
        std::string name() const override {
            return "EltradeIslDriver";
        }

        std::string manufacturer() const override {
            return "Eltrade";
        }

        std::string resolveOperator(const std::string &operatorId) const override;
    };

} // namespace fiscal::driver
