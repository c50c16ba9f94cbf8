#include "fiscal/driver/EltradeIslDriver.hpp"

#include "fiscal/protocol/EltradeIslCodec.hpp"

namespace fiscal::driver {

    EltradeIslDriver::EltradeIslDriver(std::unique_ptr<transport::Channel> channel, DriverOptions options)
        : IslDriver(std::move(channel), std::make_unique<protocol::EltradeIslCodec>(), std::move(options)) {
    }

    std::string EltradeIslDriver::resolveOperator(const std::string &operatorId) const {
        if (!operatorId.empty()) return operatorId;
        return options_.operatorName.empty() ? protocol::eltrade::DEFAULT_OPERATOR_NAME : options_.operatorName;
    }

} // namespace fiscal::driver
