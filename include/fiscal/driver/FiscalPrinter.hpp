#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

#include "fiscal/model/DeviceInfo.hpp"
#include "fiscal/model/Enums.hpp"
#include "fiscal/model/Receipt.hpp"
#include "fiscal/types/DeviceStatus.hpp"
#include "fiscal/utils/DateTimeFormatter.hpp"

namespace fiscal::driver {

    struct DeviceResponse {
        std::string raw;
        types::DeviceStatus status;
    };

    /**
     * @brief Primitive operations every fiscal device variant provides.
     *
     * Implementations never throw on device or transport problems: every
     * failure is reported inside the returned DeviceStatus.
     */
    class FiscalPrinter {
    public:
        virtual ~FiscalPrinter() = default;

        virtual const model::DeviceInfo &deviceInfo() const = 0;

        virtual void setDeviceInfo(const model::DeviceInfo &info) = 0;

        virtual types::DeviceStatus getStatus() = 0;

        virtual std::pair<std::optional<utils::DateTime>, types::DeviceStatus> getDateTime() = 0;

        virtual types::DeviceStatus setDateTime(const utils::DateTime &dateTime) = 0;

        virtual DeviceResponse openReceipt(const std::string &uniqueSaleNumber,
                                           const std::string &operatorId,
                                           const std::string &operatorPassword) = 0;

        virtual DeviceResponse openReversalReceipt(model::ReversalReason reason,
                                                   const std::string &receiptNumber,
                                                   const utils::DateTime &receiptDateTime,
                                                   const std::string &fiscalMemorySerialNumber,
                                                   const std::string &uniqueSaleNumber,
                                                   const std::string &operatorId,
                                                   const std::string &operatorPassword) = 0;

        virtual DeviceResponse addItem(int department,
                                       const std::string &text,
                                       double unitPrice,
                                       model::TaxGroup taxGroup,
                                       double quantity,
                                       double priceModifierValue,
                                       model::PriceModifierType priceModifierType) = 0;

        virtual DeviceResponse addComment(const std::string &text) = 0;

        virtual DeviceResponse addPayment(double amount, model::PaymentType paymentType) = 0;

        virtual DeviceResponse subtotalChangeAmount(double amount) = 0;

        virtual DeviceResponse closeReceipt() = 0;

        virtual DeviceResponse abortReceipt() = 0;

        virtual DeviceResponse fullPaymentAndCloseReceipt() = 0;

        virtual DeviceResponse printDailyReport(bool zeroing) = 0;

        virtual DeviceResponse printReportForDate(const utils::DateTime &startDate,
                                                  const utils::DateTime &endDate,
                                                  model::ReportType type) = 0;

        virtual DeviceResponse moneyTransfer(double amount,
                                             const std::string &operatorId,
                                             const std::string &operatorPassword) = 0;

        virtual DeviceResponse printDuplicate() = 0;

        /**
         * @brief Receipt metadata read back from the device after a close
         */
        virtual std::pair<model::ReceiptInfo, types::DeviceStatus> readLastReceiptInfo() = 0;

        virtual std::pair<std::string, types::DeviceStatus> getTaxIdentificationNumber() = 0;

        virtual std::pair<std::optional<double>, types::DeviceStatus> readCashAmount() = 0;

        virtual std::pair<model::DeviceInfo, types::DeviceStatus> readDeviceInfo() = 0;

        virtual void setPaymentTypeOverrides(const std::map<model::PaymentType, std::string> &overrides) = 0;
    };

} // namespace fiscal::driver
