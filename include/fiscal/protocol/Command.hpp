#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fiscal::protocol {

    struct Command {
        uint8_t opcode = 0;
        std::string payload;
    };

    struct RawResponse {
        std::string payload;
        std::vector<uint8_t> statusBytes;
    };

} // namespace fiscal::protocol
