#include "fiscal/driver/FiscalOperations.hpp"

#include "fiscal/types/Error.hpp"
#include "fiscal/utils/NumberFormatter.hpp"
#include "logger/Logger.hpp"

namespace fiscal::driver {

    std::string receiptStateToString(ReceiptState state) {
        switch (state) {
            case ReceiptState::Idle: return "Idle";
            case ReceiptState::Opened: return "Opened";
            case ReceiptState::Selling: return "Selling";
            case ReceiptState::Paying: return "Paying";
            case ReceiptState::Closed: return "Closed";
            case ReceiptState::Aborted: return "Aborted";
            default: return "Unknown";
        }
    }

    void to_json(nlohmann::json &j, const ReceiptResult &result) {
        j = result.status;
        if (!result.info.empty()) {
            j.update(nlohmann::json(result.info));
        }
    }

    void to_json(nlohmann::json &j, const DateTimeResult &result) {
        j = result.status;
        if (result.deviceDateTime) {
            j["deviceDateTime"] = utils::formatDateTime(*result.deviceDateTime, utils::formats::Iso);
        }
    }

    void to_json(nlohmann::json &j, const CashResult &result) {
        j = result.status;
        if (result.amount) {
            j["amount"] = *result.amount;
        }
    }

    FiscalOperations::FiscalOperations(FiscalPrinter &printer)
        : printer_(printer) {
    }

    void FiscalOperations::transition(ReceiptState state) {
        state_ = state;
        history_.push_back(state);
    }

    void FiscalOperations::resetState() {
        state_ = ReceiptState::Idle;
        history_.clear();
        history_.push_back(ReceiptState::Idle);
    }

    void FiscalOperations::abortReceipt() {
        // recovery path: the original failure is what gets reported
        auto response = printer_.abortReceipt();
        if (!response.status.ok()) {
            Logger::logWarning("[FiscalOperations] Abort after failure was refused by " +
                               printer_.deviceInfo().serialNumber);
        }
        transition(ReceiptState::Aborted);
    }

    ReceiptResult FiscalOperations::printReceipt(const model::Receipt &receipt) {
        resetState();
        Logger::logInfo("[FiscalOperations] Printing receipt " + receipt.uniqueSaleNumber + " with " +
                        std::to_string(receipt.items.size()) + " item(s)");

        printer_.abortReceipt();

        auto open = printer_.openReceipt(receipt.uniqueSaleNumber, receipt.operatorId, receipt.operatorPassword);
        if (!open.status.ok()) {
            abortReceipt();
            open.status.addInfo("Error occurred while opening new fiscal receipt");
            return {model::ReceiptInfo{}, open.status};
        }
        transition(ReceiptState::Opened);

        return printReceiptBody(receipt);
    }

    ReceiptResult FiscalOperations::printReversalReceipt(const model::ReversalReceipt &receipt) {
        resetState();
        Logger::logInfo("[FiscalOperations] Printing reversal of receipt " + receipt.receiptNumber +
                        " (" + model::toString(receipt.reason) + ")");

        printer_.abortReceipt();

        auto open = printer_.openReversalReceipt(receipt.reason,
                                                 receipt.receiptNumber,
                                                 receipt.receiptDateTime,
                                                 receipt.fiscalMemorySerialNumber,
                                                 receipt.uniqueSaleNumber,
                                                 receipt.operatorId,
                                                 receipt.operatorPassword);
        if (!open.status.ok()) {
            abortReceipt();
            open.status.addInfo("Error occurred while opening new fiscal reversal receipt");
            return {model::ReceiptInfo{}, open.status};
        }
        transition(ReceiptState::Opened);

        return printReceiptBody(receipt);
    }

    types::DeviceStatus FiscalOperations::applyItem(const model::Item &item) {
        switch (item.type) {
            case model::ItemType::Comment:
                return printer_.addComment(item.text).status;
            case model::ItemType::Sale:
                return printer_.addItem(item.department,
                                        item.text,
                                        item.unitPrice,
                                        item.taxGroup,
                                        item.quantity,
                                        item.priceModifierValue,
                                        item.priceModifierType).status;
            case model::ItemType::SurchargeAmount:
                return printer_.subtotalChangeAmount(item.amount).status;
            case model::ItemType::DiscountAmount:
                return printer_.subtotalChangeAmount(-item.amount).status;
            default:
                // footer comments are printed after the payments
                return types::DeviceStatus{};
        }
    }

    ReceiptResult FiscalOperations::printReceiptBody(const model::Receipt &receipt) {
        size_t itemNumber = 0;
        for (const auto &item: receipt.items) {
            ++itemNumber;
            if (item.type == model::ItemType::FooterComment) continue;

            if (state_ != ReceiptState::Selling) transition(ReceiptState::Selling);
            auto status = applyItem(item);
            if (!status.ok()) {
                abortReceipt();
                status.addInfo("Error occurred in Item " + std::to_string(itemNumber));
                Logger::logWarning("[FiscalOperations] Receipt " + receipt.uniqueSaleNumber +
                                   " aborted at item " + std::to_string(itemNumber));
                return {model::ReceiptInfo{}, status};
            }
        }

        transition(ReceiptState::Paying);
        if (receipt.payments.empty()) {
            auto close = printer_.fullPaymentAndCloseReceipt();
            if (!close.status.ok()) {
                abortReceipt();
                close.status.addInfo("Error occurred while making full payment in cash and closing the receipt");
                return {model::ReceiptInfo{}, close.status};
            }
        } else {
            size_t paymentNumber = 0;
            for (const auto &payment: receipt.payments) {
                ++paymentNumber;
                if (payment.paymentType == model::PaymentType::Change) continue;

                auto response = printer_.addPayment(payment.amount, payment.paymentType);
                if (!response.status.ok()) {
                    abortReceipt();
                    response.status.addInfo("Error occurred in Payment " + std::to_string(paymentNumber));
                    Logger::logWarning("[FiscalOperations] Receipt " + receipt.uniqueSaleNumber +
                                       " aborted at payment " + std::to_string(paymentNumber));
                    return {model::ReceiptInfo{}, response.status};
                }
            }

            itemNumber = 0;
            for (const auto &item: receipt.items) {
                ++itemNumber;
                if (item.type != model::ItemType::FooterComment) continue;

                auto response = printer_.addComment(item.text);
                if (!response.status.ok()) {
                    abortReceipt();
                    response.status.addInfo("Error occurred in Item " + std::to_string(itemNumber));
                    return {model::ReceiptInfo{}, response.status};
                }
            }

            auto close = printer_.closeReceipt();
            if (!close.status.ok()) {
                abortReceipt();
                close.status.addInfo("Error occurred while closing the receipt");
                return {model::ReceiptInfo{}, close.status};
            }
        }
        transition(ReceiptState::Closed);

        auto [info, status] = printer_.readLastReceiptInfo();
        if (status.ok()) {
            Logger::logInfo("[FiscalOperations] Receipt " + info.receiptNumber + " closed, amount " +
                            utils::formatAmount(info.receiptAmount));
        } else {
            Logger::logWarning("[FiscalOperations] Receipt " + receipt.uniqueSaleNumber +
                               " closed but its info could not be read back");
        }
        return {info, status};
    }

    DateTimeResult FiscalOperations::checkStatus() {
        auto [dateTime, status] = printer_.getDateTime();
        if (!dateTime) {
            status.addInfo("Error occurred while reading current status");
            status.addError(types::codes::WrongFormat, "Cannot read current date and time");
        }
        return {dateTime, status};
    }

    types::DeviceStatus FiscalOperations::setDateTime(const model::CurrentDateTime &dateTime) {
        return printer_.setDateTime(dateTime.deviceDateTime);
    }

    types::DeviceStatus FiscalOperations::printMoneyDeposit(const model::TransferAmount &transfer) {
        return printer_.moneyTransfer(transfer.amount, transfer.operatorId, transfer.operatorPassword).status;
    }

    types::DeviceStatus FiscalOperations::printMoneyWithdraw(const model::TransferAmount &transfer) {
        if (transfer.amount < 0) {
            types::DeviceStatus status;
            status.addError(types::codes::InvalidArgument, "Withdraw amount must be positive number");
            return status;
        }
        return printer_.moneyTransfer(-transfer.amount, transfer.operatorId, transfer.operatorPassword).status;
    }

    types::DeviceStatus FiscalOperations::printZReport() {
        return printer_.printDailyReport(true).status;
    }

    types::DeviceStatus FiscalOperations::printXReport() {
        return printer_.printDailyReport(false).status;
    }

    types::DeviceStatus FiscalOperations::printDuplicate() {
        return printer_.printDuplicate().status;
    }

    types::DeviceStatus FiscalOperations::printFiscalReport(const model::FiscalReport &report) {
        auto response = printer_.printReportForDate(report.startDate, report.endDate, report.type);
        if (!response.status.ok()) {
            response.status.addInfo("Error occurred while printing " + model::toString(report.type) +
                                    " fiscal report");
        }
        return response.status;
    }

    DateTimeResult FiscalOperations::reset() {
        printer_.abortReceipt();
        printer_.fullPaymentAndCloseReceipt();
        resetState();
        return checkStatus();
    }

    CashResult FiscalOperations::cash() {
        auto [amount, status] = printer_.readCashAmount();
        return {amount, status};
    }

} // namespace fiscal::driver
