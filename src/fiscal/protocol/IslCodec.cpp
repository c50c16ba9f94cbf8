#include "fiscal/protocol/IslCodec.hpp"

#include "fiscal/status/StatusDecoder.hpp"
#include "fiscal/types/Error.hpp"
#include "fiscal/utils/NumberFormatter.hpp"
#include "fiscal/utils/TextUtils.hpp"

namespace fiscal::protocol {

    using model::PaymentType;
    using model::PriceModifierType;
    using model::ReversalReason;

    IslCodec::IslCodec()
        : IslCodec(TokenTable<PaymentType>("Payment type", types::codes::UnsupportedPaymentType, {
                                               {PaymentType::Cash, "P"},
                                               {PaymentType::Card, "C"},
                                               {PaymentType::Check, "N"},
                                               {PaymentType::Reserved1, "D"}
                                           }),
                   TokenTable<ReversalReason>("Reversal reason", types::codes::UnsupportedReversalReason, {
                                                  {ReversalReason::OperatorError, "0"},
                                                  {ReversalReason::Refund, "1"},
                                                  {ReversalReason::TaxBaseReduction, "2"}
                                              })) {
    }

    IslCodec::IslCodec(TokenTable<PaymentType> paymentTypes, TokenTable<ReversalReason> reversalReasons)
        : taxGroups_(cyrillicTaxGroups()),
          paymentTypes_(std::move(paymentTypes)),
          reversalReasons_(std::move(reversalReasons)) {
        limits_ = {isl::ITEM_TEXT_MAX_LENGTH, isl::COMMENT_TEXT_MAX_LENGTH};
    }

    size_t IslCodec::statusByteCount() const {
        return status::ISL_STATUS_BYTES;
    }

    types::Result<RawResponse> IslCodec::decode(const std::string &body) const {
        // separator sits right before the fixed status segment
        if (body.size() < statusByteCount() + 1 ||
            body[body.size() - statusByteCount() - 1] != isl::STATUS_SEPARATOR) {
            return types::Result<RawResponse>::failure(
                types::ErrorKind::ProtocolSyntaxError, types::codes::WrongFormat,
                "Response has no status segment");
        }
        size_t separator = body.size() - statusByteCount() - 1;
        RawResponse response;
        response.payload = body.substr(0, separator);
        response.statusBytes.assign(body.begin() + static_cast<long>(separator) + 1, body.end());
        return types::Result<RawResponse>::success(std::move(response));
    }

    Command IslCodec::getStatus() const {
        return {isl::GET_STATUS, ""};
    }

    Command IslCodec::getDateTime() const {
        return {isl::GET_DATE_TIME, ""};
    }

    const char *IslCodec::dateTimeResponseFormat() const {
        return utils::formats::ShortYear;
    }

    Command IslCodec::setDateTime(const utils::DateTime &dateTime) const {
        return {isl::SET_DATE_TIME, utils::formatDateTime(dateTime, utils::formats::ShortYear)};
    }

    Command IslCodec::openReceipt(const std::string &uniqueSaleNumber,
                                  const std::string &operatorId,
                                  const std::string &operatorPassword) const {
        return {isl::OPEN_RECEIPT, operatorId + "," + operatorPassword + "," + uniqueSaleNumber};
    }

    types::Result<Command> IslCodec::openReversalReceipt(ReversalReason reason,
                                                         const std::string &receiptNumber,
                                                         const utils::DateTime &receiptDateTime,
                                                         const std::string &fiscalMemorySerialNumber,
                                                         const std::string &uniqueSaleNumber,
                                                         const std::string &operatorId,
                                                         const std::string &operatorPassword) const {
        auto reasonToken = reversalReasons_.lookup(reason);
        if (reasonToken.isError()) {
            return types::Result<Command>::failure(reasonToken.error());
        }
        return commandResult(isl::OPEN_REVERSAL_RECEIPT,
                             operatorId + "," + operatorPassword + "," + uniqueSaleNumber + "," +
                             reasonToken.value() + "," + receiptNumber + "," +
                             utils::formatDateTime(receiptDateTime, utils::formats::ShortYear) + "," +
                             fiscalMemorySerialNumber);
    }

    types::Result<Command> IslCodec::addItem(int department,
                                             const std::string &text,
                                             double unitPrice,
                                             model::TaxGroup taxGroup,
                                             double quantity,
                                             double priceModifierValue,
                                             PriceModifierType priceModifierType) const {
        std::string data = utils::withMaxLength(utils::toWindows1251(text), limits_.itemTextMaxLength);
        if (department <= 0) {
            auto token = taxGroups_.lookup(taxGroup);
            if (token.isError()) {
                return types::Result<Command>::failure(token.error());
            }
            data += "\t" + token.value();
        } else {
            data += "\t" + std::to_string(department) + "\t";
        }
        data += utils::formatAmount(unitPrice);

        if (quantity != 0.0) {
            data += "*" + utils::formatQuantity(quantity);
        }

        if (priceModifierValue != 0.0) {
            switch (priceModifierType) {
                case PriceModifierType::DiscountPercent:
                    data += "," + utils::formatAmount(-priceModifierValue);
                    break;
                case PriceModifierType::DiscountAmount:
                    data += "$" + utils::formatAmount(-priceModifierValue);
                    break;
                case PriceModifierType::SurchargePercent:
                    data += "," + utils::formatAmount(priceModifierValue);
                    break;
                case PriceModifierType::SurchargeAmount:
                    data += "$" + utils::formatAmount(priceModifierValue);
                    break;
                default:
                    break;
            }
        }

        return commandResult(department <= 0 ? isl::SELL : isl::SELL_DEPARTMENT, std::move(data));
    }

    Command IslCodec::addComment(const std::string &text) const {
        return {isl::FISCAL_TEXT, utils::withMaxLength(utils::toWindows1251(text), limits_.commentTextMaxLength)};
    }

    types::Result<Command> IslCodec::addPayment(double amount, PaymentType paymentType) const {
        auto token = paymentTypes_.lookup(paymentType);
        if (token.isError()) {
            return types::Result<Command>::failure(token.error());
        }
        return commandResult(isl::TOTAL, "\t" + token.value() + utils::formatAmount(amount));
    }

    Command IslCodec::subtotalChangeAmount(double amount) const {
        return {isl::SUBTOTAL, "10;" + utils::formatAmount(amount)};
    }

    Command IslCodec::closeReceipt() const {
        return {isl::CLOSE_RECEIPT, ""};
    }

    Command IslCodec::abortReceipt() const {
        return {isl::ABORT_RECEIPT, ""};
    }

    std::vector<Command> IslCodec::fullPaymentAndCloseReceipt() const {
        return {{isl::TOTAL, "\t"}, {isl::CLOSE_RECEIPT, ""}};
    }

    Command IslCodec::printDailyReport(bool zeroing) const {
        return {isl::DAILY_REPORT, zeroing ? "0" : "2"};
    }

    Command IslCodec::printReportForDate(const utils::DateTime &startDate,
                                         const utils::DateTime &endDate,
                                         model::ReportType type) const {
        return {
            type == model::ReportType::Brief ? isl::BRIEF_REPORT_FOR_DATE : isl::DETAILED_REPORT_FOR_DATE,
            utils::formatDateTime(startDate, utils::formats::ReportDate) + "," +
            utils::formatDateTime(endDate, utils::formats::ReportDate)
        };
    }

    Command IslCodec::moneyTransfer(double amount, const std::string &, const std::string &) const {
        return {isl::MONEY_TRANSFER, utils::formatAmount(amount)};
    }

    Command IslCodec::lastReceiptQrCode() const {
        return {isl::LAST_RECEIPT_QR, ""};
    }

    Command IslCodec::taxIdentificationNumber() const {
        return {isl::TAX_IDENTIFICATION_NUMBER, ""};
    }

    Command IslCodec::printDuplicate() const {
        return {isl::PRINT_DUPLICATE, "1"};
    }

    Command IslCodec::readCashAmount() const {
        return {isl::MONEY_TRANSFER, "0"};
    }

    Command IslCodec::readDeviceInfo() const {
        return {isl::DEVICE_INFO, "1"};
    }

} // namespace fiscal::protocol
