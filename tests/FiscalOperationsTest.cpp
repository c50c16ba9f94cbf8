#include <gtest/gtest.h>

#include <algorithm>

#include "fiscal/driver/FiscalOperations.hpp"
#include "fiscal/driver/ZfpDriver.hpp"
#include "support/FakeChannel.hpp"
#include "support/RecordingPrinter.hpp"

using namespace fiscal;
using fiscal::driver::FiscalOperations;
using fiscal::driver::ReceiptState;
using fiscal::model::ItemType;
using fiscal::model::PaymentType;
using fiscal::test::RecordingPrinter;

namespace {
    model::Item sale(const std::string &text, double price, double quantity = 1) {
        model::Item item;
        item.type = ItemType::Sale;
        item.text = text;
        item.unitPrice = price;
        item.quantity = quantity;
        item.taxGroup = model::TaxGroup::TaxGroup2;
        return item;
    }

    model::Item textItem(ItemType type, const std::string &text) {
        model::Item item;
        item.type = type;
        item.text = text;
        return item;
    }

    model::Item amountItem(ItemType type, double amount) {
        model::Item item;
        item.type = type;
        item.amount = amount;
        return item;
    }

    model::Receipt receipt() {
        model::Receipt r;
        r.uniqueSaleNumber = "DT279013-0000-0000001";
        r.operatorId = "1";
        r.items = {sale("Bread", 1.5, 2), sale("Milk", 2.4)};
        return r;
    }

    bool contains(const std::vector<std::string> &calls, const std::string &call) {
        return std::find(calls.begin(), calls.end(), call) != calls.end();
    }
}

TEST(FiscalOperationsTest, ReceiptWithPaymentsAndFooter) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    auto r = receipt();
    r.items.push_back(textItem(ItemType::FooterComment, "Thank you"));
    r.payments = {{5.4, PaymentType::Cash}};

    auto result = operations.printReceipt(r);
    EXPECT_TRUE(result.status.ok());
    EXPECT_EQ(result.info.receiptNumber, "0000042");
    EXPECT_EQ(printer.calls(), (std::vector<std::string>{
                  "abortReceipt",
                  "openReceipt(DT279013-0000-0000001,1)",
                  "addItem(Bread,1.50*2)",
                  "addItem(Milk,2.40*1)",
                  "addPayment(cash,5.40)",
                  "addComment(Thank you)",
                  "closeReceipt",
                  "readLastReceiptInfo"
                  }));
    EXPECT_EQ(operations.state(), ReceiptState::Closed);
    EXPECT_EQ(operations.history(), (std::vector<ReceiptState>{
                  ReceiptState::Idle, ReceiptState::Opened, ReceiptState::Selling, ReceiptState::Paying,
                  ReceiptState::Closed
                  }));
}

TEST(FiscalOperationsTest, ReceiptWithoutPaymentsIsSettledInCash) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    auto result = operations.printReceipt(receipt());
    EXPECT_TRUE(result.status.ok());
    EXPECT_EQ(printer.count("fullPaymentAndCloseReceipt"), 1u);
    EXPECT_EQ(printer.count("closeReceipt"), 0u);
    EXPECT_EQ(printer.count("addPayment"), 0u);
}

TEST(FiscalOperationsTest, FailingItemAbortsAndReportsItsIndex) {
    RecordingPrinter printer;
    printer.failOn("addItem", 2);
    FiscalOperations operations(printer);

    auto r = receipt();
    r.items.push_back(sale("Cheese", 7.2));
    auto result = operations.printReceipt(r);

    EXPECT_FALSE(result.status.ok());
    EXPECT_TRUE(result.status.hasCode("E301"));
    EXPECT_TRUE(result.status.hasMessage("Error occurred in Item 2"));
    EXPECT_TRUE(result.info.empty());
    EXPECT_EQ(printer.count("addItem"), 2u);
    EXPECT_EQ(printer.count("abortReceipt"), 2u);
    EXPECT_EQ(printer.count("fullPaymentAndCloseReceipt"), 0u);
    EXPECT_EQ(printer.count("readLastReceiptInfo"), 0u);
    EXPECT_EQ(operations.state(), ReceiptState::Aborted);
}

TEST(FiscalOperationsTest, ItemIndexCountsComments) {
    RecordingPrinter printer;
    printer.failOn("addItem");
    FiscalOperations operations(printer);

    model::Receipt r;
    r.items = {textItem(ItemType::Comment, "Table 4"), sale("Bread", 1.5)};
    auto result = operations.printReceipt(r);

    EXPECT_TRUE(result.status.hasMessage("Error occurred in Item 2"));
    EXPECT_TRUE(contains(printer.calls(), "addComment(Table 4)"));
}

TEST(FiscalOperationsTest, SubtotalAmountsAreSignedBySurchargeOrDiscount) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    model::Receipt r;
    r.items = {sale("Bread", 10), amountItem(ItemType::SurchargeAmount, 1), amountItem(ItemType::DiscountAmount, 0.5)};
    auto result = operations.printReceipt(r);

    EXPECT_TRUE(result.status.ok());
    EXPECT_TRUE(contains(printer.calls(), "subtotalChangeAmount(1.00)"));
    EXPECT_TRUE(contains(printer.calls(), "subtotalChangeAmount(-0.50)"));
}

TEST(FiscalOperationsTest, RefusedSubtotalAbortsReceipt) {
    RecordingPrinter printer;
    printer.failOn("subtotalChangeAmount");
    FiscalOperations operations(printer);

    model::Receipt r;
    r.items = {sale("Bread", 10), amountItem(ItemType::DiscountAmount, 0.5), sale("Milk", 2)};
    auto result = operations.printReceipt(r);

    EXPECT_TRUE(result.status.hasMessage("Error occurred in Item 2"));
    EXPECT_EQ(printer.count("addItem"), 1u);
    EXPECT_EQ(operations.state(), ReceiptState::Aborted);
}

TEST(FiscalOperationsTest, ChangePaymentsAreSkipped) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    auto r = receipt();
    r.payments = {{10, PaymentType::Cash}, {4.6, PaymentType::Change}, {2, PaymentType::Card}};
    auto result = operations.printReceipt(r);

    EXPECT_TRUE(result.status.ok());
    EXPECT_EQ(printer.count("addPayment"), 2u);
    EXPECT_TRUE(contains(printer.calls(), "addPayment(card,2.00)"));
}

TEST(FiscalOperationsTest, FailingPaymentReportsItsIndex) {
    RecordingPrinter printer;
    printer.failOn("addPayment", 2);
    FiscalOperations operations(printer);

    auto r = receipt();
    r.payments = {{1, PaymentType::Cash}, {4.4, PaymentType::Card}};
    auto result = operations.printReceipt(r);

    EXPECT_TRUE(result.status.hasMessage("Error occurred in Payment 2"));
    EXPECT_EQ(printer.count("closeReceipt"), 0u);
    EXPECT_EQ(operations.state(), ReceiptState::Aborted);
}

TEST(FiscalOperationsTest, RefusedOpenIsReported) {
    RecordingPrinter printer;
    printer.failOn("openReceipt");
    FiscalOperations operations(printer);

    auto result = operations.printReceipt(receipt());
    EXPECT_TRUE(result.status.hasMessage("Error occurred while opening new fiscal receipt"));
    EXPECT_EQ(printer.count("addItem"), 0u);
    EXPECT_EQ(printer.count("abortReceipt"), 2u);
}

TEST(FiscalOperationsTest, RefusedCloseIsReported) {
    RecordingPrinter printer;
    printer.failOn("fullPaymentAndCloseReceipt");
    FiscalOperations operations(printer);

    auto result = operations.printReceipt(receipt());
    EXPECT_TRUE(result.status.hasMessage(
        "Error occurred while making full payment in cash and closing the receipt"));
    EXPECT_EQ(operations.state(), ReceiptState::Aborted);
}

TEST(FiscalOperationsTest, RefusedInitialAbortDoesNotStopTheReceipt) {
    RecordingPrinter printer;
    printer.failOn("abortReceipt", 1);
    FiscalOperations operations(printer);

    auto result = operations.printReceipt(receipt());
    EXPECT_TRUE(result.status.ok());
    EXPECT_EQ(operations.state(), ReceiptState::Closed);
}

TEST(FiscalOperationsTest, UnreadableReceiptInfoKeepsClosedState) {
    RecordingPrinter printer;
    printer.failOn("readLastReceiptInfo");
    FiscalOperations operations(printer);

    auto result = operations.printReceipt(receipt());
    EXPECT_FALSE(result.status.ok());
    EXPECT_TRUE(result.info.empty());
    EXPECT_EQ(operations.state(), ReceiptState::Closed);
}

TEST(FiscalOperationsTest, ReversalReceipt) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    model::ReversalReceipt r;
    r.items = {sale("Bread", 1.5)};
    r.reason = model::ReversalReason::Refund;
    r.receiptNumber = "0000042";
    auto result = operations.printReversalReceipt(r);

    EXPECT_TRUE(result.status.ok());
    EXPECT_TRUE(contains(printer.calls(), "openReversalReceipt(refund,0000042)"));
    EXPECT_EQ(printer.count("openReceipt"), 0u);
}

TEST(FiscalOperationsTest, RefusedReversalOpenIsReported) {
    RecordingPrinter printer;
    printer.failOn("openReversalReceipt");
    FiscalOperations operations(printer);

    auto result = operations.printReversalReceipt(model::ReversalReceipt{});
    EXPECT_TRUE(result.status.hasMessage("Error occurred while opening new fiscal reversal receipt"));
}

TEST(FiscalOperationsTest, CheckStatusReturnsDeviceTime) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    auto result = operations.checkStatus();
    EXPECT_TRUE(result.status.ok());
    ASSERT_TRUE(result.deviceDateTime.has_value());
    EXPECT_EQ(nlohmann::json(result)["deviceDateTime"].get<std::string>(), "2024-05-17T10:30:00");
}

TEST(FiscalOperationsTest, CheckStatusWithoutTimeIsAnError) {
    RecordingPrinter printer;
    printer.setDeviceDateTime(std::nullopt);
    FiscalOperations operations(printer);

    auto result = operations.checkStatus();
    EXPECT_FALSE(result.status.ok());
    EXPECT_TRUE(result.status.hasMessage("Cannot read current date and time"));
    EXPECT_TRUE(result.status.hasMessage("Error occurred while reading current status"));
}

TEST(FiscalOperationsTest, MoneyTransfers) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    EXPECT_TRUE(operations.printMoneyDeposit({20, "1", "0000"}).ok());
    EXPECT_TRUE(operations.printMoneyWithdraw({15, "1", "0000"}).ok());
    EXPECT_EQ(printer.calls(), (std::vector<std::string>{"moneyTransfer(20.00)", "moneyTransfer(-15.00)"}));
}

TEST(FiscalOperationsTest, NegativeWithdrawIsRejected) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    auto status = operations.printMoneyWithdraw({-5, "", ""});
    EXPECT_FALSE(status.ok());
    EXPECT_TRUE(status.hasCode("E403"));
    EXPECT_TRUE(status.hasMessage("Withdraw amount must be positive number"));
    EXPECT_TRUE(printer.calls().empty());
}

TEST(FiscalOperationsTest, Reports) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    operations.printZReport();
    operations.printXReport();
    operations.printDuplicate();
    EXPECT_EQ(printer.calls(), (std::vector<std::string>{
                  "printDailyReport(Z)", "printDailyReport(X)", "printDuplicate"}));
}

TEST(FiscalOperationsTest, RefusedFiscalReportNamesItsType) {
    RecordingPrinter printer;
    printer.failOn("printReportForDate");
    FiscalOperations operations(printer);

    model::FiscalReport report;
    report.type = model::ReportType::Detailed;
    auto status = operations.printFiscalReport(report);
    EXPECT_TRUE(status.hasMessage("Error occurred while printing detailed fiscal report"));
}

TEST(FiscalOperationsTest, ResetAbortsSettlesAndChecksStatus) {
    RecordingPrinter printer;
    printer.failOn("abortReceipt");
    printer.failOn("fullPaymentAndCloseReceipt");
    FiscalOperations operations(printer);

    auto result = operations.reset();
    EXPECT_TRUE(result.status.ok());
    EXPECT_EQ(printer.calls(), (std::vector<std::string>{
                  "abortReceipt", "fullPaymentAndCloseReceipt", "getDateTime"}));
    EXPECT_EQ(operations.state(), ReceiptState::Idle);
}

TEST(FiscalOperationsTest, CashAmount) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    auto result = operations.cash();
    ASSERT_TRUE(result.amount.has_value());
    EXPECT_DOUBLE_EQ(*result.amount, 125.50);
    EXPECT_DOUBLE_EQ(nlohmann::json(result)["amount"].get<double>(), 125.50);
}

TEST(FiscalOperationsTest, ReceiptResultJsonMergesStatusAndInfo) {
    RecordingPrinter printer;
    FiscalOperations operations(printer);

    nlohmann::json json = operations.printReceipt(receipt());
    EXPECT_TRUE(json["ok"].get<bool>());
    EXPECT_EQ(json["receiptNumber"].get<std::string>(), "0000042");
    EXPECT_EQ(json["fiscalMemorySerialNumber"].get<std::string>(), "50123456");
    EXPECT_EQ(json["receiptDateTime"].get<std::string>(), "2024-05-17T10:30:00");
    EXPECT_TRUE(json["messages"].is_array());
}

TEST(FiscalOperationsTest, EndToEndReceiptOverZfp) {
    auto state = std::make_shared<test::FakeChannel::State>();
    driver::ZfpDriver zfp(std::make_unique<test::FakeChannel>(state), {});
    state->respond(test::zfpBody(""));
    state->respond(test::zfpBody(""));
    state->respond(test::zfpBody(""));
    state->respond(test::zfpBody(""));
    state->respond(test::zfpBody("50123456*0000042*2024-05-17*10:30:00*3.00"));

    model::Receipt r;
    r.uniqueSaleNumber = "DT279013-0000-0000001";
    r.items = {sale("Bread", 1.5, 2)};

    FiscalOperations operations(zfp);
    auto result = operations.printReceipt(r);

    ASSERT_TRUE(result.status.ok());
    EXPECT_EQ(state->opcodes(), (std::vector<uint8_t>{0x39, 0x30, 0x31, 0x36, 0x72}));
    EXPECT_EQ(state->sent[1].payload, "1;0000;1;1;2$DT279013-0000-0000001");
    EXPECT_EQ(state->sent[2].payload, "Bread" + std::string(31, ' ') + ";\xC1;1.50*2");
    EXPECT_EQ(result.info.receiptNumber, "0000042");
    EXPECT_DOUBLE_EQ(result.info.receiptAmount, 3.00);
}
