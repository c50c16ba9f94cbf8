#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fiscal/driver/FiscalPrinter.hpp"
#include "fiscal/model/Receipt.hpp"

namespace fiscal::driver {

    enum class ReceiptState {
        Idle,
        Opened,
        Selling,
        Paying,
        Closed,
        Aborted
    };

    std::string receiptStateToString(ReceiptState state);

    struct ReceiptResult {
        model::ReceiptInfo info;
        types::DeviceStatus status;
    };

    struct DateTimeResult {
        std::optional<utils::DateTime> deviceDateTime;
        types::DeviceStatus status;
    };

    struct CashResult {
        std::optional<double> amount;
        types::DeviceStatus status;
    };

    void to_json(nlohmann::json &j, const ReceiptResult &result);

    void to_json(nlohmann::json &j, const DateTimeResult &result);

    void to_json(nlohmann::json &j, const CashResult &result);

    /**
     * @brief Vendor independent fiscal actions built on the FiscalPrinter primitives.
     *
     * Receipts are printed fail-fast: the first item or payment that the device
     * refuses aborts the receipt and is reported by its 1-based index. The device
     * stays the source of truth, so ReceiptInfo is always read back after close.
     */
    class FiscalOperations {
    public:
        explicit FiscalOperations(FiscalPrinter &printer);

        ReceiptResult printReceipt(const model::Receipt &receipt);

        ReceiptResult printReversalReceipt(const model::ReversalReceipt &receipt);

        DateTimeResult checkStatus();

        types::DeviceStatus setDateTime(const model::CurrentDateTime &dateTime);

        types::DeviceStatus printMoneyDeposit(const model::TransferAmount &transfer);

        types::DeviceStatus printMoneyWithdraw(const model::TransferAmount &transfer);

        types::DeviceStatus printZReport();

        types::DeviceStatus printXReport();

        types::DeviceStatus printDuplicate();

        types::DeviceStatus printFiscalReport(const model::FiscalReport &report);

        /**
         * @brief Aborts whatever is open, settles it in cash and reports the device status
         */
        DateTimeResult reset();

        CashResult cash();

        ReceiptState state() const {
            return state_;
        }

        const std::vector<ReceiptState> &history() const {
            return history_;
        }

    private:
        FiscalPrinter &printer_;
        ReceiptState state_ = ReceiptState::Idle;
        std::vector<ReceiptState> history_;

        ReceiptResult printReceiptBody(const model::Receipt &receipt);

        types::DeviceStatus applyItem(const model::Item &item);

        void abortReceipt();

        void transition(ReceiptState state);

        void resetState();
    };

} // namespace fiscal::driver
