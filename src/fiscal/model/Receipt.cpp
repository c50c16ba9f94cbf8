#include "fiscal/model/Receipt.hpp"

#include <stdexcept>

namespace fiscal::model {

    namespace {
        template<typename T>
        T enumValue(const std::optional<T> &value, const std::string &field, const std::string &text) {
            if (!value) {
                throw std::invalid_argument("Unsupported value '" + text + "' for " + field);
            }
            return *value;
        }

        std::string stringOr(const nlohmann::json &j, const std::string &key, const std::string &fallback = "") {
            if (j.contains(key) && !j[key].is_null()) {
                return j[key].get<std::string>();
            }
            return fallback;
        }

        double numberOr(const nlohmann::json &j, const std::string &key, double fallback = 0.0) {
            if (j.contains(key) && !j[key].is_null()) {
                return j[key].get<double>();
            }
            return fallback;
        }

        utils::DateTime dateTimeAt(const nlohmann::json &j, const std::string &key) {
            auto text = j.at(key).get<std::string>();
            auto parsed = utils::parseIsoDateTime(text);
            if (!parsed) {
                throw std::invalid_argument("Invalid date-time '" + text + "' for " + key);
            }
            return *parsed;
        }

        void readCommon(const nlohmann::json &j, Receipt &receipt) {
            receipt.uniqueSaleNumber = stringOr(j, "uniqueSaleNumber");
            receipt.operatorId = stringOr(j, "operator");
            receipt.operatorPassword = stringOr(j, "operatorPassword");
            receipt.items.clear();
            receipt.payments.clear();
            if (j.contains("items") && j["items"].is_array()) {
                receipt.items = j["items"].get<std::vector<Item> >();
            }
            if (j.contains("payments") && j["payments"].is_array()) {
                receipt.payments = j["payments"].get<std::vector<Payment> >();
            }
        }
    }

    void from_json(const nlohmann::json &j, Item &item) {
        auto type = stringOr(j, "type", "sale");
        item.type = enumValue(itemTypeFromString(type), "type", type);
        item.text = stringOr(j, "text");
        item.department = j.contains("department") ? j["department"].get<int>() : 0;
        item.unitPrice = numberOr(j, "unitPrice");
        if (j.contains("taxGroup") && !j["taxGroup"].is_null()) {
            int number = j["taxGroup"].get<int>();
            item.taxGroup = taxGroupFromNumber(number).value_or(TaxGroup::Unspecified);
        }
        item.quantity = numberOr(j, "quantity");
        item.priceModifierValue = numberOr(j, "priceModifierValue");
        auto modifier = stringOr(j, "priceModifierType", "none");
        item.priceModifierType = enumValue(priceModifierTypeFromString(modifier), "priceModifierType", modifier);
        item.amount = numberOr(j, "amount");
    }

    void to_json(nlohmann::json &j, const Item &item) {
        j = nlohmann::json{
                {"type", toString(item.type)},
                {"text", item.text}
        };
        if (item.type == ItemType::Sale) {
            j["department"] = item.department;
            j["unitPrice"] = item.unitPrice;
            j["taxGroup"] = static_cast<int>(item.taxGroup);
            j["quantity"] = item.quantity;
            j["priceModifierValue"] = item.priceModifierValue;
            j["priceModifierType"] = toString(item.priceModifierType);
        } else if (item.type == ItemType::SurchargeAmount || item.type == ItemType::DiscountAmount) {
            j["amount"] = item.amount;
        }
    }

    void from_json(const nlohmann::json &j, Payment &payment) {
        payment.amount = numberOr(j, "amount");
        auto type = stringOr(j, "paymentType", "cash");
        payment.paymentType = enumValue(paymentTypeFromString(type), "paymentType", type);
    }

    void to_json(nlohmann::json &j, const Payment &payment) {
        j = nlohmann::json{
                {"amount", payment.amount},
                {"paymentType", toString(payment.paymentType)}
        };
    }

    void from_json(const nlohmann::json &j, Receipt &receipt) {
        readCommon(j, receipt);
    }

    void to_json(nlohmann::json &j, const Receipt &receipt) {
        j = nlohmann::json{
                {"uniqueSaleNumber", receipt.uniqueSaleNumber},
                {"operator", receipt.operatorId},
                {"operatorPassword", receipt.operatorPassword},
                {"items", receipt.items},
                {"payments", receipt.payments}
        };
    }

    void from_json(const nlohmann::json &j, ReversalReceipt &receipt) {
        readCommon(j, receipt);
        auto reason = stringOr(j, "reason", "operator-error");
        receipt.reason = enumValue(reversalReasonFromString(reason), "reason", reason);
        receipt.receiptNumber = stringOr(j, "receiptNumber");
        receipt.receiptDateTime = dateTimeAt(j, "receiptDateTime");
        receipt.fiscalMemorySerialNumber = stringOr(j, "fiscalMemorySerialNumber");
    }

    void to_json(nlohmann::json &j, const ReceiptInfo &info) {
        j = nlohmann::json{
                {"receiptNumber", info.receiptNumber},
                {"receiptDateTime", utils::formatDateTime(info.receiptDateTime, utils::formats::Iso)},
                {"receiptAmount", info.receiptAmount},
                {"fiscalMemorySerialNumber", info.fiscalMemorySerialNumber}
        };
    }

    void from_json(const nlohmann::json &j, TransferAmount &transfer) {
        transfer.amount = numberOr(j, "amount");
        transfer.operatorId = stringOr(j, "operator");
        transfer.operatorPassword = stringOr(j, "operatorPassword");
    }

    void from_json(const nlohmann::json &j, CurrentDateTime &dateTime) {
        dateTime.deviceDateTime = dateTimeAt(j, "deviceDateTime");
    }

    void from_json(const nlohmann::json &j, FiscalReport &report) {
        report.startDate = dateTimeAt(j, "startDate");
        report.endDate = dateTimeAt(j, "endDate");
        auto type = stringOr(j, "type", "brief");
        report.type = enumValue(reportTypeFromString(type), "type", type);
    }

} // namespace fiscal::model
