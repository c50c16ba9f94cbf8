#pragma once

#include <map>
#include <string>
#include <utility>

#include "fiscal/model/Enums.hpp"
#include "fiscal/types/Result.hpp"

namespace fiscal::protocol {

    /**
     * @brief Vendor mapping from an enumeration to its protocol token.
     * Values without a token fail with UnsupportedValue.
     */
    template<typename E>
    class TokenTable {
    public:
        TokenTable(std::string subject, std::string unsupportedCode, std::map<E, std::string> tokens)
            : subject_(std::move(subject)), unsupportedCode_(std::move(unsupportedCode)), tokens_(std::move(tokens)) {
        }

        types::Result<std::string> lookup(E value) const {
            auto it = tokens_.find(value);
            if (it == tokens_.end()) {
                return types::Result<std::string>::failure(
                    types::ErrorKind::UnsupportedValue, unsupportedCode_,
                    subject_ + " " + model::toString(value) + " unsupported");
            }
            return types::Result<std::string>::success(it->second);
        }

        void set(E value, const std::string &token) {
            tokens_[value] = token;
        }

        bool contains(E value) const {
            return tokens_.count(value) > 0;
        }

    private:
        std::string subject_;
        std::string unsupportedCode_;
        std::map<E, std::string> tokens_;
    };

} // namespace fiscal::protocol
