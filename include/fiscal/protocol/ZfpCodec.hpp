#pragma once

#include "fiscal/protocol/CommandCodec.hpp"

namespace fiscal::protocol {

    namespace zfp {
        constexpr uint8_t GET_STATUS = 0x20;
        constexpr uint8_t VERSION = 0x21;
        constexpr uint8_t OPEN_RECEIPT = 0x30;
        constexpr uint8_t SELL = 0x31;
        constexpr uint8_t SUBTOTAL = 0x33;
        constexpr uint8_t SELL_DEPARTMENT = 0x34;
        constexpr uint8_t PAYMENT = 0x35;
        constexpr uint8_t FULL_PAYMENT_AND_CLOSE = 0x36;
        constexpr uint8_t FREE_TEXT = 0x37;
        constexpr uint8_t CLOSE_RECEIPT = 0x38;
        constexpr uint8_t ABORT_RECEIPT = 0x39;
        constexpr uint8_t PRINT_DUPLICATE = 0x3A;
        constexpr uint8_t MONEY_TRANSFER = 0x3B;
        constexpr uint8_t SET_DATE_TIME = 0x48;
        constexpr uint8_t READ_FD_NUMBERS = 0x60;
        constexpr uint8_t TAX_IDENTIFICATION_NUMBER = 0x61;
        constexpr uint8_t GET_DATE_TIME = 0x68;
        constexpr uint8_t DAILY_AMOUNTS = 0x6E;
        constexpr uint8_t LAST_RECEIPT_QR = 0x72;
        constexpr uint8_t DETAILED_REPORT_FOR_DATE = 0x7A;
        constexpr uint8_t BRIEF_REPORT_FOR_DATE = 0x7B;
        constexpr uint8_t DAILY_REPORT = 0x7C;

        // 36 symbols for the article name, 34 of them printed; shorter names are space padded
        constexpr size_t ITEM_TEXT_MANDATORY_LENGTH = 36;
        constexpr size_t ITEM_TEXT_MAX_LENGTH = 34;
        constexpr size_t COMMENT_TEXT_MAX_LENGTH = 46;
    }

    /**
     * @brief ';' delimited grammar; every response body starts with 7 status bytes
     */
    class ZfpCodec : public CommandCodec {
    public:
        ZfpCodec();

        char fieldDelimiter() const override {
            return ';';
        }

        size_t statusByteCount() const override;

        types::Result<RawResponse> decode(const std::string &body) const override;

        Command getStatus() const override;

        Command getDateTime() const override;

        const char *dateTimeResponseFormat() const override;

        Command setDateTime(const utils::DateTime &dateTime) const override;

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

        types::Result<Command> addItem(int department,
                                       const std::string &text,
                                       double unitPrice,
                                       model::TaxGroup taxGroup,
                                       double quantity,
                                       double priceModifierValue,
                                       model::PriceModifierType priceModifierType) const override;

        Command addComment(const std::string &text) const override;

        types::Result<Command> addPayment(double amount, model::PaymentType paymentType) const override;

        Command subtotalChangeAmount(double amount) const override;

        Command closeReceipt() const override;

        Command abortReceipt() const override;

        std::vector<Command> fullPaymentAndCloseReceipt() const override;

        Command printDailyReport(bool zeroing) const override;

        Command printReportForDate(const utils::DateTime &startDate,
                                   const utils::DateTime &endDate,
                                   model::ReportType type) const override;

        Command moneyTransfer(double amount,
                              const std::string &operatorId,
                              const std::string &operatorPassword) const override;

        Command lastReceiptQrCode() const override;

        Command taxIdentificationNumber() const override;

        Command printDuplicate() const override;

        Command readCashAmount() const override;

        Command readFiscalDeviceNumbers() const;

        Command readVersion() const;

    protected:
        TokenTable<model::PaymentType> &paymentTypes() override {
            return paymentTypes_;
        }

    private:
        TokenTable<model::TaxGroup> taxGroups_;
        TokenTable<model::PaymentType> paymentTypes_;
        TokenTable<model::ReversalReason> reversalReasons_;
    };

} // namespace fiscal::protocol
