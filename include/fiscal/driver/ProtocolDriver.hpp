#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "fiscal/driver/FiscalPrinter.hpp"
#include "fiscal/protocol/CommandCodec.hpp"
#include "fiscal/status/StatusDecoder.hpp"
#include "fiscal/transport/Channel.hpp"

namespace fiscal::driver {

    struct DriverOptions {
        std::string operatorId = "1";
        std::string operatorPassword = "0000";
        std::string operatorName = "Operator";
    };

    /**
     * @brief FiscalPrinter on top of Channel + CommandCodec + StatusDecoder.
     *
     * Every call is one request/response round trip (two for vendors that
     * settle and close separately); transport exceptions are turned into
     * E101 errors here.
     */
    class ProtocolDriver : public FiscalPrinter {
    public:
        ProtocolDriver(std::unique_ptr<transport::Channel> channel,
                       std::unique_ptr<protocol::CommandCodec> codec,
                       status::StatusDecoder decoder,
                       DriverOptions options);

        ~ProtocolDriver() override = default;

        const model::DeviceInfo &deviceInfo() const override {
            return info_;
        }

        void setDeviceInfo(const model::DeviceInfo &info) override;

        types::DeviceStatus getStatus() override;

        std::pair<std::optional<utils::DateTime>, types::DeviceStatus> getDateTime() override;

        types::DeviceStatus setDateTime(const utils::DateTime &dateTime) override;

        DeviceResponse openReceipt(const std::string &uniqueSaleNumber,
                                   const std::string &operatorId,
                                   const std::string &operatorPassword) override;

        DeviceResponse openReversalReceipt(model::ReversalReason reason,
                                           const std::string &receiptNumber,
                                           const utils::DateTime &receiptDateTime,
                                           const std::string &fiscalMemorySerialNumber,
                                           const std::string &uniqueSaleNumber,
                                           const std::string &operatorId,
                                           const std::string &operatorPassword) override;

        DeviceResponse addItem(int department,
                               const std::string &text,
                               double unitPrice,
                               model::TaxGroup taxGroup,
                               double quantity,
                               double priceModifierValue,
                               model::PriceModifierType priceModifierType) override;

        DeviceResponse addComment(const std::string &text) override;

        DeviceResponse addPayment(double amount, model::PaymentType paymentType) override;

        DeviceResponse subtotalChangeAmount(double amount) override;

        DeviceResponse closeReceipt() override;

        DeviceResponse abortReceipt() override;

        DeviceResponse fullPaymentAndCloseReceipt() override;

        DeviceResponse printDailyReport(bool zeroing) override;

        DeviceResponse printReportForDate(const utils::DateTime &startDate,
                                          const utils::DateTime &endDate,
                                          model::ReportType type) override;

        DeviceResponse moneyTransfer(double amount,
                                     const std::string &operatorId,
                                     const std::string &operatorPassword) override;

        DeviceResponse printDuplicate() override;

        std::pair<model::ReceiptInfo, types::DeviceStatus> readLastReceiptInfo() override;

        std::pair<std::string, types::DeviceStatus> getTaxIdentificationNumber() override;

        void setPaymentTypeOverrides(const std::map<model::PaymentType, std::string> &overrides) override;

        const DriverOptions &options() const {
            return options_;
        }

    protected:
        DeviceResponse request(const protocol::Command &command);

        DeviceResponse request(const types::Result<protocol::Command> &command);

        protocol::CommandCodec &codec() {
            return *codec_;
        }

        virtual std::string name() const = 0;

        virtual std::string resolveOperator(const std::string &operatorId) const;

        std::string resolvePassword(const std::string &operatorPassword) const;

        /**
         * @brief Drawer amount from fields[index]; integers are in stotinki
         */
        std::pair<std::optional<double>, types::DeviceStatus> parseCashAmount(
            const DeviceResponse &response, size_t index, size_t minFields) const;

        DriverOptions options_;
        model::DeviceInfo info_;

    private:
        std::unique_ptr<transport::Channel> channel_;
        std::unique_ptr<protocol::CommandCodec> codec_;
        status::StatusDecoder decoder_;
        std::mutex requestMutex_;
    };

    /**
     * @brief Parses "<FM>*<receipt number>*<yyyy-MM-dd>*<HH:mm:ss>*<amount>"
     */
    std::pair<model::ReceiptInfo, types::DeviceStatus> parseReceiptQrCode(const std::string &qrCodeData,
                                                                          types::DeviceStatus status);

} // namespace fiscal::driver
