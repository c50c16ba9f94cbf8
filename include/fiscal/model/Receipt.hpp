#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fiscal/model/Enums.hpp"
#include "fiscal/utils/DateTimeFormatter.hpp"

namespace fiscal::model {

    struct Item {
        ItemType type = ItemType::Sale;
        std::string text;
        int department = 0;
        double unitPrice = 0.0;
        TaxGroup taxGroup = TaxGroup::Unspecified;
        double quantity = 0.0;
        double priceModifierValue = 0.0;
        PriceModifierType priceModifierType = PriceModifierType::None;
        // surcharge-amount and discount-amount items
        double amount = 0.0;
    };

    struct Payment {
        double amount = 0.0;
        PaymentType paymentType = PaymentType::Cash;
    };

    struct Receipt {
        std::string uniqueSaleNumber;
        std::string operatorId;
        std::string operatorPassword;
        std::vector<Item> items;
        std::vector<Payment> payments;
    };

    struct ReversalReceipt : Receipt {
        ReversalReason reason = ReversalReason::OperatorError;
        std::string receiptNumber;
        utils::DateTime receiptDateTime{};
        std::string fiscalMemorySerialNumber;
    };

    struct ReceiptInfo {
        std::string fiscalMemorySerialNumber;
        std::string receiptNumber;
        utils::DateTime receiptDateTime{};
        double receiptAmount = 0.0;

        bool empty() const {
            return receiptNumber.empty();
        }
    };

    struct Credentials {
        std::string operatorId;
        std::string operatorPassword;
    };

    struct TransferAmount {
        double amount = 0.0;
        std::string operatorId;
        std::string operatorPassword;
    };

    struct CurrentDateTime {
        utils::DateTime deviceDateTime{};
    };

    struct FiscalReport {
        utils::DateTime startDate{};
        utils::DateTime endDate{};
        ReportType type = ReportType::Brief;
    };

    void from_json(const nlohmann::json &j, Item &item);

    void to_json(nlohmann::json &j, const Item &item);

    void from_json(const nlohmann::json &j, Payment &payment);

    void to_json(nlohmann::json &j, const Payment &payment);

    void from_json(const nlohmann::json &j, Receipt &receipt);

    void to_json(nlohmann::json &j, const Receipt &receipt);

    void from_json(const nlohmann::json &j, ReversalReceipt &receipt);

    void to_json(nlohmann::json &j, const ReceiptInfo &info);

    void from_json(const nlohmann::json &j, TransferAmount &transfer);

    void from_json(const nlohmann::json &j, CurrentDateTime &dateTime);

    void from_json(const nlohmann::json &j, FiscalReport &report);

} // namespace fiscal::model
