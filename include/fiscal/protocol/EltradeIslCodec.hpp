#pragma once

#include "fiscal/protocol/IslCodec.hpp"

namespace fiscal::protocol {

    namespace eltrade {
        constexpr uint8_t OPEN_FISCAL_RECEIPT = 0x90;
        constexpr const char *DEFAULT_OPERATOR_NAME = "Operator";
    }

    /**
     * @brief Eltrade flavour of ISL: receipts are opened by operator name, reversal
     * uses the same opcode with the 'S' marker, reports take only the start date.
     */
    class EltradeIslCodec : public IslCodec {
    public:
        EltradeIslCodec();

        Command openReceipt(const std::string &uniqueSaleNumber,
                            const std::string &operatorId,
                            const std::string &operatorPassword) const override;

        types::Result<Command> openReversalReceipt(model::ReversalReason reason,
                                                   const std::string &receiptNumber,
                                                   const utils::DateTime &receiptDateTime,
                                                   const std::string &fiscalMemorySerialNumber,
                                                   const std::string &uniqueSaleNumber,
                                                   const std::string &operatorId,
                                                   const std::string &operatorPassword) const override;

        Command printReportForDate(const utils::DateTime &startDate,
                                   const utils::DateTime &endDate,
                                   model::ReportType type) const override;
    };

} // namespace fiscal::protocol
