#include "fiscal/protocol/ZfpCodec.hpp"

#include <cstdio>

#include "fiscal/status/StatusDecoder.hpp"
#include "fiscal/types/Error.hpp"
#include "fiscal/utils/NumberFormatter.hpp"
#include "fiscal/utils/TextUtils.hpp"

namespace fiscal::protocol {

    using model::PaymentType;
    using model::PriceModifierType;
    using model::ReversalReason;

    ZfpCodec::ZfpCodec()
        : taxGroups_(cyrillicTaxGroups()),
          paymentTypes_("Payment type", types::codes::UnsupportedPaymentType, {
                            {PaymentType::Cash, "0"},
                            {PaymentType::Check, "1"},
                            {PaymentType::Coupons, "2"},
                            {PaymentType::ExtCoupons, "3"},
                            {PaymentType::Packaging, "4"},
                            {PaymentType::InternalUsage, "5"},
                            {PaymentType::Damage, "6"},
                            {PaymentType::Card, "7"},
                            {PaymentType::Bank, "8"},
                            {PaymentType::Reserved1, "9"},
                            {PaymentType::Reserved2, "10"}
                        }),
          reversalReasons_("Reversal reason", types::codes::UnsupportedReversalReason, {
                               {ReversalReason::OperatorError, "0"},
                               {ReversalReason::Refund, "1"},
                               {ReversalReason::TaxBaseReduction, "2"}
                           }) {
        limits_ = {zfp::ITEM_TEXT_MAX_LENGTH, zfp::COMMENT_TEXT_MAX_LENGTH};
    }

    size_t ZfpCodec::statusByteCount() const {
        return status::ZFP_STATUS_BYTES;
    }

    types::Result<RawResponse> ZfpCodec::decode(const std::string &body) const {
        if (body.size() < statusByteCount()) {
            return types::Result<RawResponse>::failure(
                types::ErrorKind::ProtocolSyntaxError, types::codes::WrongFormat,
                "Response is shorter than the status segment");
        }
        RawResponse response;
        response.statusBytes.assign(body.begin(), body.begin() + static_cast<long>(statusByteCount()));
        response.payload = body.substr(statusByteCount());
        return types::Result<RawResponse>::success(std::move(response));
    }

    Command ZfpCodec::getStatus() const {
        return {zfp::GET_STATUS, ""};
    }

    Command ZfpCodec::getDateTime() const {
        return {zfp::GET_DATE_TIME, ""};
    }

    const char *ZfpCodec::dateTimeResponseFormat() const {
        return utils::formats::LongYearNoSeconds;
    }

    Command ZfpCodec::setDateTime(const utils::DateTime &dateTime) const {
        return {zfp::SET_DATE_TIME, utils::formatDateTime(dateTime, utils::formats::ShortYear)};
    }

    Command ZfpCodec::openReceipt(const std::string &uniqueSaleNumber,
                                  const std::string &operatorId,
                                  const std::string &operatorPassword) const {
        // <OperNum>;<OperPass>;<ReceiptFormat>;<PrintVAT>;<PrintType>$<UniqueReceiptNumber>
        // detailed, VAT included, postponed printing
        return {
            zfp::OPEN_RECEIPT,
            operatorId + ";" + operatorPassword + ";1;1;2$" + uniqueSaleNumber
        };
    }

    types::Result<Command> ZfpCodec::openReversalReceipt(ReversalReason reason,
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
        return commandResult(zfp::OPEN_RECEIPT,
                             operatorId + ";" + operatorPassword + ";1;1;D;" + reasonToken.value() + ";" +
                             receiptNumber + ";" +
                             utils::formatDateTime(receiptDateTime, utils::formats::ShortYear) + ";" +
                             fiscalMemorySerialNumber + ";" + uniqueSaleNumber);
    }

    types::Result<Command> ZfpCodec::addItem(int department,
                                             const std::string &text,
                                             double unitPrice,
                                             model::TaxGroup taxGroup,
                                             double quantity,
                                             double priceModifierValue,
                                             PriceModifierType priceModifierType) const {
        std::string itemText = utils::padRight(
            utils::withMaxLength(utils::toWindows1251(text), limits_.itemTextMaxLength),
            zfp::ITEM_TEXT_MANDATORY_LENGTH);

        std::string data = itemText + ";";
        if (department <= 0) {
            auto token = taxGroups_.lookup(taxGroup);
            if (token.isError()) {
                return types::Result<Command>::failure(token.error());
            }
            data += token.value();
        } else {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "%02X", department + 0x80);
            data += hex;
        }
        data += ";" + utils::formatAmount(unitPrice);

        if (quantity != 0.0) {
            data += "*" + utils::formatQuantity(quantity);
        }

        switch (priceModifierType) {
            case PriceModifierType::DiscountPercent:
                data += "," + utils::formatAmount(-priceModifierValue);
                break;
            case PriceModifierType::DiscountAmount:
                data += ":" + utils::formatAmount(-priceModifierValue);
                break;
            case PriceModifierType::SurchargePercent:
                data += "," + utils::formatAmount(priceModifierValue);
                break;
            case PriceModifierType::SurchargeAmount:
                data += ":" + utils::formatAmount(priceModifierValue);
                break;
            default:
                break;
        }

        return commandResult(department <= 0 ? zfp::SELL : zfp::SELL_DEPARTMENT, std::move(data));
    }

    Command ZfpCodec::addComment(const std::string &text) const {
        return {zfp::FREE_TEXT, utils::withMaxLength(utils::toWindows1251(text), limits_.commentTextMaxLength)};
    }

    types::Result<Command> ZfpCodec::addPayment(double amount, PaymentType paymentType) const {
        auto token = paymentTypes_.lookup(paymentType);
        if (token.isError()) {
            return types::Result<Command>::failure(token.error());
        }
        // <PaymentType>;<OptionChange>;<Amount>*, "1" means without change
        return commandResult(zfp::PAYMENT, token.value() + ";1;" + utils::formatAmount(amount) + "*");
    }

    Command ZfpCodec::subtotalChangeAmount(double amount) const {
        return {zfp::SUBTOTAL, "1;0:" + utils::formatAmount(amount)};
    }

    Command ZfpCodec::closeReceipt() const {
        return {zfp::CLOSE_RECEIPT, ""};
    }

    Command ZfpCodec::abortReceipt() const {
        return {zfp::ABORT_RECEIPT, ""};
    }

    std::vector<Command> ZfpCodec::fullPaymentAndCloseReceipt() const {
        return {{zfp::FULL_PAYMENT_AND_CLOSE, ""}};
    }

    Command ZfpCodec::printDailyReport(bool zeroing) const {
        return {zfp::DAILY_REPORT, zeroing ? "Z" : "X"};
    }

    Command ZfpCodec::printReportForDate(const utils::DateTime &startDate,
                                         const utils::DateTime &endDate,
                                         model::ReportType type) const {
        return {
            type == model::ReportType::Brief ? zfp::BRIEF_REPORT_FOR_DATE : zfp::DETAILED_REPORT_FOR_DATE,
            utils::formatDateTime(startDate, utils::formats::ReportDate) + ";" +
            utils::formatDateTime(endDate, utils::formats::ReportDate)
        };
    }

    Command ZfpCodec::moneyTransfer(double amount,
                                    const std::string &operatorId,
                                    const std::string &operatorPassword) const {
        return {zfp::MONEY_TRANSFER, operatorId + ";" + operatorPassword + ";0;" + utils::formatAmount(amount)};
    }

    Command ZfpCodec::lastReceiptQrCode() const {
        return {zfp::LAST_RECEIPT_QR, "B"};
    }

    Command ZfpCodec::taxIdentificationNumber() const {
        return {zfp::TAX_IDENTIFICATION_NUMBER, ""};
    }

    Command ZfpCodec::printDuplicate() const {
        return {zfp::PRINT_DUPLICATE, ""};
    }

    Command ZfpCodec::readCashAmount() const {
        return {zfp::DAILY_AMOUNTS, "0"};
    }

    Command ZfpCodec::readFiscalDeviceNumbers() const {
        return {zfp::READ_FD_NUMBERS, ""};
    }

    Command ZfpCodec::readVersion() const {
        return {zfp::VERSION, ""};
    }

} // namespace fiscal::protocol
