#include "fiscal/protocol/EltradeIslCodec.hpp"

#include "fiscal/types/Error.hpp"

namespace fiscal::protocol {

    using model::PaymentType;
    using model::ReversalReason;

    EltradeIslCodec::EltradeIslCodec()
        : IslCodec(TokenTable<PaymentType>("Payment type", types::codes::UnsupportedPaymentType, {
                                               {PaymentType::Cash, "P"},
                                               {PaymentType::Check, "N"},
                                               {PaymentType::Coupons, "C"},
                                               {PaymentType::ExtCoupons, "D"},
                                               {PaymentType::Packaging, "I"},
                                               {PaymentType::InternalUsage, "J"},
                                               {PaymentType::Damage, "K"},
                                               {PaymentType::Card, "L"},
                                               {PaymentType::Bank, "M"},
                                               {PaymentType::Reserved1, "Q"},
                                               {PaymentType::Reserved2, "R"}
                                           }),
                   TokenTable<ReversalReason>("Reversal reason", types::codes::UnsupportedReversalReason, {
                                                  {ReversalReason::OperatorError, "O"},
                                                  {ReversalReason::Refund, "R"},
                                                  {ReversalReason::TaxBaseReduction, "T"}
                                              })) {
    }

    // The operator field carries the operator name on these devices; the driver
    // substitutes the configured name when the caller leaves it empty.
    Command EltradeIslCodec::openReceipt(const std::string &uniqueSaleNumber,
                                         const std::string &operatorId,
                                         const std::string &) const {
        return {eltrade::OPEN_FISCAL_RECEIPT, operatorId + "," + uniqueSaleNumber};
    }

    types::Result<Command> EltradeIslCodec::openReversalReceipt(ReversalReason reason,
                                                                const std::string &receiptNumber,
                                                                const utils::DateTime &receiptDateTime,
                                                                const std::string &fiscalMemorySerialNumber,
                                                                const std::string &uniqueSaleNumber,
                                                                const std::string &operatorId,
                                                                const std::string &) const {
        auto reasonToken = reversalReasons_.lookup(reason);
        if (reasonToken.isError()) {
            return types::Result<Command>::failure(reasonToken.error());
        }
        // <OperName>,<UNP>,S,<FMIN>,<Reason>,<num>,<time>
        return commandResult(eltrade::OPEN_FISCAL_RECEIPT,
                             operatorId + "," + uniqueSaleNumber + ",S," + fiscalMemorySerialNumber + "," +
                             reasonToken.value() + "," + receiptNumber + "," +
                             utils::formatDateTime(receiptDateTime, utils::formats::Iso));
    }

    Command EltradeIslCodec::printReportForDate(const utils::DateTime &startDate,
                                                const utils::DateTime &,
                                                model::ReportType) const {
        return {isl::BRIEF_REPORT_FOR_DATE, utils::formatDateTime(startDate, utils::formats::DayMonth)};
    }

} // namespace fiscal::protocol
