#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "fiscal/driver/FiscalPrinter.hpp"
#include "fiscal/model/Receipt.hpp"

namespace fiscal::service {

    enum class PrintJobAction {
        CheckStatus,
        PrintReceipt,
        PrintReversalReceipt,
        PrintZReport,
        PrintXReport,
        PrintDuplicate,
        PrintMoneyDeposit,
        PrintMoneyWithdraw,
        PrintFiscalReport,
        SetDateTime,
        Reset,
        Cash
    };

    enum class TaskStatus {
        Unknown, // id not found
        Enqueued,
        Running,
        Finished
    };

    std::string printJobActionToString(PrintJobAction action);

    std::optional<PrintJobAction> printJobActionFromString(const std::string &text);

    std::string taskStatusToString(TaskStatus status);

    using Document = std::variant<std::monostate,
        model::Receipt,
        model::ReversalReceipt,
        model::TransferAmount,
        model::CurrentDateTime,
        model::FiscalReport>;

    /**
     * @brief Builds the document an action expects from its JSON body
     * @throws std::invalid_argument / nlohmann::json::exception on malformed input
     */
    Document documentFromJson(PrintJobAction action, const nlohmann::json &json);

    constexpr int DEFAULT_TIMEOUT_MS = 29000;

    struct PrintJob {
        std::string taskId;
        std::shared_ptr<driver::FiscalPrinter> printer;
        PrintJobAction action = PrintJobAction::CheckStatus;
        Document document;
        TaskStatus status = TaskStatus::Enqueued;
        nlohmann::json result;
        std::optional<std::chrono::system_clock::time_point> finished;
        std::chrono::steady_clock::time_point lastUpdate = std::chrono::steady_clock::now();
    };

    struct TaskInfo {
        TaskStatus taskStatus = TaskStatus::Unknown;
        nlohmann::json result;
    };

    void to_json(nlohmann::json &j, const TaskInfo &info);

    /**
     * @brief Runs the job's action against its printer and returns the JSON result.
     *
     * A document that does not match the action gives an E403 result.
     */
    nlohmann::json runPrintJob(const PrintJob &job);

} // namespace fiscal::service
