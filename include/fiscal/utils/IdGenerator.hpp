#pragma once

#include <string>

namespace fiscal::utils {

    /**
     * @brief 22 character URL-safe token (16 random bytes, base64url without padding)
     */
    std::string generateUrlSafeId();

} // namespace fiscal::utils
