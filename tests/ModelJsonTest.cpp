#include <gtest/gtest.h>

#include "fiscal/model/Receipt.hpp"
#include "fiscal/service/PrintJob.hpp"

using namespace fiscal;
using fiscal::model::ItemType;
using fiscal::model::PaymentType;

TEST(EnumsTest, NamesRoundTripThroughLookup) {
    EXPECT_EQ(model::toString(PaymentType::ExtCoupons), "ext-coupons");
    EXPECT_EQ(model::paymentTypeFromString("internal-usage"), PaymentType::InternalUsage);
    EXPECT_FALSE(model::paymentTypeFromString("Cash").has_value());

    EXPECT_EQ(model::toString(model::TaxGroup::TaxGroup2), "TaxGroup2");
    EXPECT_EQ(model::taxGroupFromNumber(8), model::TaxGroup::TaxGroup8);
    EXPECT_FALSE(model::taxGroupFromNumber(0).has_value());
    EXPECT_FALSE(model::taxGroupFromNumber(9).has_value());

    EXPECT_EQ(model::reversalReasonFromString("taxbase-reduction"), model::ReversalReason::TaxBaseReduction);
    EXPECT_EQ(model::toString(model::ReportType::Detailed), "detailed");
    EXPECT_EQ(model::priceModifierTypeFromString("surcharge-percent"), model::PriceModifierType::SurchargePercent);
}

TEST(ReceiptJsonTest, ParsesReceiptWithDefaults) {
    auto json = nlohmann::json::parse(R"({
        "uniqueSaleNumber": "DT279013-DD01-0000001",
        "operator": "1",
        "operatorPassword": "0000",
        "items": [
            {"text": "Bread", "unitPrice": 1.5, "taxGroup": 2, "quantity": 2},
            {"type": "comment", "text": "Thank you"},
            {"type": "discount-amount", "amount": 0.5},
            {"text": "Milk", "department": 3, "unitPrice": 2.4, "quantity": 1,
             "priceModifierType": "discount-percent", "priceModifierValue": 10}
        ],
        "payments": [
            {"amount": 5, "paymentType": "card"},
            {"amount": 2}
        ]
    })");

    auto receipt = json.get<model::Receipt>();
    EXPECT_EQ(receipt.uniqueSaleNumber, "DT279013-DD01-0000001");
    EXPECT_EQ(receipt.operatorId, "1");
    EXPECT_EQ(receipt.operatorPassword, "0000");
    ASSERT_EQ(receipt.items.size(), 4u);

    EXPECT_EQ(receipt.items[0].type, ItemType::Sale);
    EXPECT_EQ(receipt.items[0].taxGroup, model::TaxGroup::TaxGroup2);
    EXPECT_DOUBLE_EQ(receipt.items[0].quantity, 2);
    EXPECT_EQ(receipt.items[0].priceModifierType, model::PriceModifierType::None);
    EXPECT_EQ(receipt.items[1].type, ItemType::Comment);
    EXPECT_EQ(receipt.items[2].type, ItemType::DiscountAmount);
    EXPECT_DOUBLE_EQ(receipt.items[2].amount, 0.5);
    EXPECT_EQ(receipt.items[3].department, 3);
    EXPECT_EQ(receipt.items[3].taxGroup, model::TaxGroup::Unspecified);

    ASSERT_EQ(receipt.payments.size(), 2u);
    EXPECT_EQ(receipt.payments[0].paymentType, PaymentType::Card);
    EXPECT_EQ(receipt.payments[1].paymentType, PaymentType::Cash);
}

TEST(ReceiptJsonTest, UnknownEnumValuesAreRejected) {
    auto badPayment = nlohmann::json::parse(R"({"payments": [{"amount": 1, "paymentType": "bitcoin"}]})");
    EXPECT_THROW(badPayment.get<model::Receipt>(), std::invalid_argument);

    auto badItem = nlohmann::json::parse(R"({"items": [{"type": "gift", "text": "x"}]})");
    EXPECT_THROW(badItem.get<model::Receipt>(), std::invalid_argument);
}

TEST(ReceiptJsonTest, ParsesReversalReceipt) {
    auto json = nlohmann::json::parse(R"({
        "uniqueSaleNumber": "DT279013-DD01-0000001",
        "reason": "refund",
        "receiptNumber": "0000042",
        "receiptDateTime": "2024-05-17T10:30:00",
        "fiscalMemorySerialNumber": "50123456",
        "items": [{"text": "Bread", "unitPrice": 1.5, "taxGroup": 2, "quantity": 1}]
    })");

    auto reversal = json.get<model::ReversalReceipt>();
    EXPECT_EQ(reversal.reason, model::ReversalReason::Refund);
    EXPECT_EQ(reversal.receiptNumber, "0000042");
    EXPECT_EQ(reversal.receiptDateTime.tm_year, 124);
    EXPECT_EQ(reversal.receiptDateTime.tm_hour, 10);
    EXPECT_EQ(reversal.fiscalMemorySerialNumber, "50123456");
    EXPECT_EQ(reversal.items.size(), 1u);
}

TEST(ReceiptJsonTest, ReversalNeedsValidReceiptDate) {
    auto missing = nlohmann::json::parse(R"({"receiptNumber": "0000042"})");
    EXPECT_THROW(missing.get<model::ReversalReceipt>(), nlohmann::json::exception);

    auto invalid = nlohmann::json::parse(R"({"receiptNumber": "0000042", "receiptDateTime": "yesterday"})");
    EXPECT_THROW(invalid.get<model::ReversalReceipt>(), std::invalid_argument);
}

TEST(ReceiptJsonTest, ReceiptInfoSerialization) {
    model::ReceiptInfo info;
    info.fiscalMemorySerialNumber = "50123456";
    info.receiptNumber = "0000042";
    info.receiptDateTime = utils::makeDateTime(2024, 5, 17, 10, 30);
    info.receiptAmount = 3;

    nlohmann::json json = info;
    EXPECT_EQ(json["receiptNumber"].get<std::string>(), "0000042");
    EXPECT_EQ(json["receiptDateTime"].get<std::string>(), "2024-05-17T10:30:00");
    EXPECT_DOUBLE_EQ(json["receiptAmount"].get<double>(), 3.0);
    EXPECT_EQ(json["fiscalMemorySerialNumber"].get<std::string>(), "50123456");
}

TEST(ReceiptJsonTest, ItemSerializationDependsOnType) {
    model::Item comment;
    comment.type = ItemType::Comment;
    comment.text = "Thank you";
    nlohmann::json json = comment;
    EXPECT_EQ(json, (nlohmann::json{{"type", "comment"}, {"text", "Thank you"}}));

    model::Item surcharge;
    surcharge.type = ItemType::SurchargeAmount;
    surcharge.amount = 1.25;
    json = surcharge;
    EXPECT_DOUBLE_EQ(json["amount"].get<double>(), 1.25);
    EXPECT_FALSE(json.contains("unitPrice"));
}

TEST(DocumentFromJsonTest, BuildsDocumentPerAction) {
    using service::PrintJobAction;

    auto transfer = service::documentFromJson(PrintJobAction::PrintMoneyDeposit,
                                              nlohmann::json{{"amount", 20}, {"operator", "2"}});
    ASSERT_TRUE(std::holds_alternative<model::TransferAmount>(transfer));
    EXPECT_DOUBLE_EQ(std::get<model::TransferAmount>(transfer).amount, 20);
    EXPECT_EQ(std::get<model::TransferAmount>(transfer).operatorId, "2");

    auto report = service::documentFromJson(PrintJobAction::PrintFiscalReport, nlohmann::json{
                                                {"startDate", "2024-05-01T00:00:00"},
                                                {"endDate", "2024-05-31T23:59:59"},
                                                {"type", "detailed"}
                                            });
    ASSERT_TRUE(std::holds_alternative<model::FiscalReport>(report));
    EXPECT_EQ(std::get<model::FiscalReport>(report).type, model::ReportType::Detailed);
    EXPECT_EQ(std::get<model::FiscalReport>(report).endDate.tm_mday, 31);

    auto dateTime = service::documentFromJson(PrintJobAction::SetDateTime,
                                              nlohmann::json{{"deviceDateTime", "2024-05-17T10:30:00"}});
    EXPECT_TRUE(std::holds_alternative<model::CurrentDateTime>(dateTime));

    auto none = service::documentFromJson(PrintJobAction::PrintZReport, nlohmann::json::object());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(none));
}

TEST(DocumentFromJsonTest, MalformedBodiesThrow) {
    using service::PrintJobAction;
    EXPECT_THROW(service::documentFromJson(PrintJobAction::PrintFiscalReport,
                                           nlohmann::json{{"startDate", "2024-05-01T00:00:00"},
                                                          {"endDate", "2024-05-31"}}),
                 std::invalid_argument);
    EXPECT_THROW(service::documentFromJson(PrintJobAction::PrintMoneyDeposit, nlohmann::json{{"amount", "ten"}}),
                 nlohmann::json::exception);
}
