#include "fiscal/protocol/CommandCodec.hpp"

#include "fiscal/types/Error.hpp"
#include "fiscal/utils/TextUtils.hpp"

namespace fiscal::protocol {

    std::string CommandCodec::encode(const Command &command) const {
        std::string bytes;
        bytes.reserve(command.payload.size() + 1);
        bytes.push_back(static_cast<char>(command.opcode));
        bytes += command.payload;
        return bytes;
    }

    std::vector<std::string> CommandCodec::splitFields(const std::string &payload) const {
        return utils::split(payload, fieldDelimiter());
    }

    void CommandCodec::setPaymentTypeOverrides(const std::map<model::PaymentType, std::string> &overrides) {
        auto &table = paymentTypes();
        for (const auto &[type, token]: overrides) {
            table.set(type, token);
        }
    }

    TokenTable<model::TaxGroup> cyrillicTaxGroups() {
        using model::TaxGroup;
        return TokenTable<TaxGroup>("Tax group", types::codes::UnsupportedTaxGroup, {
                                        {TaxGroup::TaxGroup1, "\xC0"},
                                        {TaxGroup::TaxGroup2, "\xC1"},
                                        {TaxGroup::TaxGroup3, "\xC2"},
                                        {TaxGroup::TaxGroup4, "\xC3"},
                                        {TaxGroup::TaxGroup5, "\xC4"},
                                        {TaxGroup::TaxGroup6, "\xC5"},
                                        {TaxGroup::TaxGroup7, "\xC6"},
                                        {TaxGroup::TaxGroup8, "\xC7"}
                                    });
    }

} // namespace fiscal::protocol
