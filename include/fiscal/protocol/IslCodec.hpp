#pragma once

#include "fiscal/protocol/CommandCodec.hpp"

namespace fiscal::protocol {

    namespace isl {
        constexpr uint8_t OPEN_REVERSAL_RECEIPT = 0x2E;
        constexpr uint8_t OPEN_RECEIPT = 0x30;
        constexpr uint8_t SELL = 0x31;
        constexpr uint8_t SUBTOTAL = 0x33;
        constexpr uint8_t TOTAL = 0x35;
        constexpr uint8_t FISCAL_TEXT = 0x36;
        constexpr uint8_t CLOSE_RECEIPT = 0x38;
        constexpr uint8_t ABORT_RECEIPT = 0x3C;
        constexpr uint8_t SET_DATE_TIME = 0x3D;
        constexpr uint8_t GET_DATE_TIME = 0x3E;
        constexpr uint8_t DAILY_REPORT = 0x45;
        constexpr uint8_t MONEY_TRANSFER = 0x46;
        constexpr uint8_t GET_STATUS = 0x4A;
        constexpr uint8_t BRIEF_REPORT_FOR_DATE = 0x4F;
        constexpr uint8_t DEVICE_INFO = 0x5A;
        constexpr uint8_t DETAILED_REPORT_FOR_DATE = 0x5E;
        constexpr uint8_t TAX_IDENTIFICATION_NUMBER = 0x63;
        constexpr uint8_t PRINT_DUPLICATE = 0x6D;
        constexpr uint8_t LAST_RECEIPT_QR = 0x74;
        constexpr uint8_t SELL_DEPARTMENT = 0x8A;

        constexpr char STATUS_SEPARATOR = 0x04;
        constexpr size_t ITEM_TEXT_MAX_LENGTH = 22;
        constexpr size_t COMMENT_TEXT_MAX_LENGTH = 42;
    }

    /**
     * @brief ',' delimited grammar; response body is payload, 0x04, then 6 status bytes
     */
    class IslCodec : public CommandCodec {
    public:
        IslCodec();

        char fieldDelimiter() const override {
            return ',';
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

        Command readDeviceInfo() const;

    protected:
        IslCodec(TokenTable<model::PaymentType> paymentTypes, TokenTable<model::ReversalReason> reversalReasons);

        TokenTable<model::PaymentType> &paymentTypes() override {
            return paymentTypes_;
        }

        TokenTable<model::TaxGroup> taxGroups_;
        TokenTable<model::PaymentType> paymentTypes_;
        TokenTable<model::ReversalReason> reversalReasons_;
    };

} // namespace fiscal::protocol
