#pragma once

#include <map>
#include <string>
#include <vector>

#include "fiscal/model/Enums.hpp"
#include "fiscal/protocol/Command.hpp"
#include "fiscal/protocol/TokenTable.hpp"
#include "fiscal/types/Result.hpp"
#include "fiscal/utils/DateTimeFormatter.hpp"

namespace fiscal::protocol {

    struct CodecLimits {
        size_t itemTextMaxLength = 0;
        size_t commentTextMaxLength = 0;
    };

    /**
     * @brief Builds vendor command payloads and splits vendor responses.
     *
     * Builders whose input goes through a vendor lookup (tax group, payment type,
     * reversal reason) return a Result so that unmapped values come back as
     * UnsupportedValue errors.
     */
    class CommandCodec {
    public:
        virtual ~CommandCodec() = default;

        virtual char fieldDelimiter() const = 0;

        virtual size_t statusByteCount() const = 0;

        /**
         * @brief Bytes handed to the channel: opcode followed by the payload
         */
        std::string encode(const Command &command) const;

        /**
         * @brief Splits a response body into payload text and status bytes
         */
        virtual types::Result<RawResponse> decode(const std::string &body) const = 0;

        std::vector<std::string> splitFields(const std::string &payload) const;

        virtual Command getStatus() const = 0;

        virtual Command getDateTime() const = 0;

        virtual const char *dateTimeResponseFormat() const = 0;

        virtual Command setDateTime(const utils::DateTime &dateTime) const = 0;

        virtual Command openReceipt(const std::string &uniqueSaleNumber,
                                    const std::string &operatorId,
                                    const std::string &operatorPassword) const = 0;

        virtual types::Result<Command> openReversalReceipt(model::ReversalReason reason,
                                                           const std::string &receiptNumber,
                                                           const utils::DateTime &receiptDateTime,
                                                           const std::string &fiscalMemorySerialNumber,
                                                           const std::string &uniqueSaleNumber,
                                                           const std::string &operatorId,
                                                           const std::string &operatorPassword) const = 0;

        virtual types::Result<Command> addItem(int department,
                                               const std::string &text,
                                               double unitPrice,
                                               model::TaxGroup taxGroup,
                                               double quantity,
                                               double priceModifierValue,
                                               model::PriceModifierType priceModifierType) const = 0;

        virtual Command addComment(const std::string &text) const = 0;

        virtual types::Result<Command> addPayment(double amount, model::PaymentType paymentType) const = 0;

        virtual Command subtotalChangeAmount(double amount) const = 0;

        virtual Command closeReceipt() const = 0;

        virtual Command abortReceipt() const = 0;

        /**
         * @brief One or more commands, executed in order, stopping at the first failure
         */
        virtual std::vector<Command> fullPaymentAndCloseReceipt() const = 0;

        virtual Command printDailyReport(bool zeroing) const = 0;

        virtual Command printReportForDate(const utils::DateTime &startDate,
                                           const utils::DateTime &endDate,
                                           model::ReportType type) const = 0;

        virtual Command moneyTransfer(double amount,
                                      const std::string &operatorId,
                                      const std::string &operatorPassword) const = 0;

        virtual Command lastReceiptQrCode() const = 0;

        virtual Command taxIdentificationNumber() const = 0;

        virtual Command printDuplicate() const = 0;

        virtual Command readCashAmount() const = 0;

        void setPaymentTypeOverrides(const std::map<model::PaymentType, std::string> &overrides);

        const CodecLimits &limits() const {
            return limits_;
        }

        void setLimits(const CodecLimits &limits) {
            limits_ = limits;
        }

    protected:
        CodecLimits limits_;

        virtual TokenTable<model::PaymentType> &paymentTypes() = 0;

        static types::Result<Command> commandResult(uint8_t opcode, std::string payload) {
            return types::Result<Command>::success(Command{opcode, std::move(payload)});
        }
    };

    // Cyrillic А..З in Windows-1251, shared by both vendor families
    TokenTable<model::TaxGroup> cyrillicTaxGroups();

} // namespace fiscal::protocol
