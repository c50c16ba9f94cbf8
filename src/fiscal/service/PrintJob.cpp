#include "fiscal/service/PrintJob.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include "fiscal/driver/FiscalOperations.hpp"
#include "fiscal/types/Error.hpp"

namespace fiscal::service {

    namespace {
        const std::array<std::pair<PrintJobAction, const char *>, 12> ACTION_NAMES = {{
            {PrintJobAction::CheckStatus, "CheckStatus"},
            {PrintJobAction::PrintReceipt, "PrintReceipt"},
            {PrintJobAction::PrintReversalReceipt, "PrintReversalReceipt"},
            {PrintJobAction::PrintZReport, "PrintZReport"},
            {PrintJobAction::PrintXReport, "PrintXReport"},
            {PrintJobAction::PrintDuplicate, "PrintDuplicate"},
            {PrintJobAction::PrintMoneyDeposit, "PrintMoneyDeposit"},
            {PrintJobAction::PrintMoneyWithdraw, "PrintMoneyWithdraw"},
            {PrintJobAction::PrintFiscalReport, "PrintFiscalReport"},
            {PrintJobAction::SetDateTime, "SetDateTime"},
            {PrintJobAction::Reset, "Reset"},
            {PrintJobAction::Cash, "Cash"}
        }};

        nlohmann::json wrongDocument(PrintJobAction action) {
            types::DeviceStatus status;
            status.addError(types::codes::InvalidArgument,
                            "Document type does not match action " + printJobActionToString(action));
            return status;
        }

        template<typename T>
        const T *documentAs(const PrintJob &job) {
            return std::get_if<T>(&job.document);
        }
    }

    std::string printJobActionToString(PrintJobAction action) {
        for (const auto &[value, name]: ACTION_NAMES) {
            if (value == action) return name;
        }
        return "Unknown";
    }

    std::optional<PrintJobAction> printJobActionFromString(const std::string &text) {
        for (const auto &[value, name]: ACTION_NAMES) {
            if (text == name) return value;
        }
        return std::nullopt;
    }

    std::string taskStatusToString(TaskStatus status) {
        switch (status) {
            case TaskStatus::Unknown: return "unknown";
            case TaskStatus::Enqueued: return "enqueued";
            case TaskStatus::Running: return "running";
            case TaskStatus::Finished: return "finished";
            default: return "unknown";
        }
    }

    void to_json(nlohmann::json &j, const TaskInfo &info) {
        j = nlohmann::json{{"taskStatus", taskStatusToString(info.taskStatus)}};
        if (!info.result.is_null()) {
            j["result"] = info.result;
        }
    }

    Document documentFromJson(PrintJobAction action, const nlohmann::json &json) {
        switch (action) {
            case PrintJobAction::PrintReceipt:
                return json.get<model::Receipt>();
            case PrintJobAction::PrintReversalReceipt:
                return json.get<model::ReversalReceipt>();
            case PrintJobAction::PrintMoneyDeposit:
            case PrintJobAction::PrintMoneyWithdraw:
                return json.get<model::TransferAmount>();
            case PrintJobAction::SetDateTime:
                return json.get<model::CurrentDateTime>();
            case PrintJobAction::PrintFiscalReport:
                return json.get<model::FiscalReport>();
            default:
                return std::monostate{};
        }
    }

    nlohmann::json runPrintJob(const PrintJob &job) {
        if (!job.printer) {
            throw std::invalid_argument("Print job " + job.taskId + " has no printer");
        }

        driver::FiscalOperations operations(*job.printer);
        switch (job.action) {
            case PrintJobAction::CheckStatus:
                return operations.checkStatus();
            case PrintJobAction::PrintReceipt:
                // a reversal is a receipt too, but only PrintReversalReceipt may print it
                if (auto receipt = documentAs<model::Receipt>(job)) return operations.printReceipt(*receipt);
                return wrongDocument(job.action);
            case PrintJobAction::PrintReversalReceipt:
                if (auto receipt = documentAs<model::ReversalReceipt>(job)) {
                    return operations.printReversalReceipt(*receipt);
                }
                return wrongDocument(job.action);
            case PrintJobAction::PrintZReport:
                return operations.printZReport();
            case PrintJobAction::PrintXReport:
                return operations.printXReport();
            case PrintJobAction::PrintDuplicate:
                return operations.printDuplicate();
            case PrintJobAction::PrintMoneyDeposit:
                if (auto transfer = documentAs<model::TransferAmount>(job)) {
                    return operations.printMoneyDeposit(*transfer);
                }
                return wrongDocument(job.action);
            case PrintJobAction::PrintMoneyWithdraw:
                if (auto transfer = documentAs<model::TransferAmount>(job)) {
                    return operations.printMoneyWithdraw(*transfer);
                }
                return wrongDocument(job.action);
            case PrintJobAction::PrintFiscalReport:
                if (auto report = documentAs<model::FiscalReport>(job)) return operations.printFiscalReport(*report);
                return wrongDocument(job.action);
            case PrintJobAction::SetDateTime:
                if (auto dateTime = documentAs<model::CurrentDateTime>(job)) return operations.setDateTime(*dateTime);
                return wrongDocument(job.action);
            case PrintJobAction::Reset:
                return operations.reset();
            case PrintJobAction::Cash:
                return operations.cash();
            default:
                return wrongDocument(job.action);
        }
    }

} // namespace fiscal::service
