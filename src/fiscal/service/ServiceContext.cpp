#include "fiscal/service/ServiceContext.hpp"

#include <stdexcept>

#include "fiscal/types/Error.hpp"
#include "logger/Logger.hpp"

namespace fiscal::service {

    ServiceContext::ServiceContext(config::ConfigManager &config,
                                   std::unique_ptr<provider::Provider> provider,
                                   JobQueue::Executor executor)
        : config_(config),
          provider_(std::move(provider)),
          queue_(std::move(executor),
                 config.options().queue.maxCompletedJobs,
                 std::chrono::milliseconds(config.options().queue.defaultTimeoutMs)) {
        if (!provider_) {
            throw std::invalid_argument("Provider cannot be null");
        }
    }

    ServiceContext::~ServiceContext() {
        queue_.stop();
    }

    void ServiceContext::setup() {
        {
            std::lock_guard<std::mutex> lock(serverIdMutex_);
            serverId_ = config_.ensureServerId();
        }
        Logger::logInfo("[ServiceContext] Server id " + serverId());
        ready_ = true;
        detect();
    }

    std::string ServiceContext::serverId() const {
        std::lock_guard<std::mutex> lock(serverIdMutex_);
        return serverId_;
    }

    RunOutcome ServiceContext::run(const std::string &printerId, PrintJobAction action, Document document,
                                   int timeoutMs) {
        auto printer = registry_.find(printerId);
        if (!printer) {
            Logger::logWarning("[ServiceContext] " + printJobActionToString(action) +
                               " requested for unknown printer " + printerId);
            types::DeviceStatus status;
            status.addError(types::codes::InvalidArgument, "Printer " + printerId + " not found");
            RunOutcome outcome;
            outcome.result = nlohmann::json(status);
            return outcome;
        }
        return queue_.run(printer, action, std::move(document), timeoutMs);
    }

    TaskInfo ServiceContext::getTaskInfo(const std::string &taskId) const {
        return queue_.getTaskInfo(taskId);
    }

    bool ServiceContext::detect(bool forceAutoDetect) {
        std::lock_guard<std::mutex> lock(detectMutex_);
        if (!ready_ || queue_.pendingCount() > 0) {
            Logger::logInfo("[ServiceContext] Detect skipped, service busy");
            return false;
        }
        ready_ = false;

        auto options = config_.options();
        registry_.clear();

        if (forceAutoDetect || options.autoDetect) {
            Logger::logInfo("[ServiceContext] Autodetecting local printers...");
            for (const auto &[uri, printer]: provider_->detectAvailablePrinters()) {
                registry_.add(printer);
            }
        }

        Logger::logInfo("[ServiceContext] Detecting configured printers...");
        for (const auto &[printerId, printerConfig]: options.printers) {
            if (printerConfig.uri.empty()) continue;

            // the same device may be known under several ids
            if (auto existing = registry_.findByUri(printerConfig.uri)) {
                registry_.put(printerId, existing);
                Logger::logInfo("[ServiceContext] Trying " + printerId + ": " + printerConfig.uri + ", OK");
                continue;
            }

            try {
                registry_.put(printerId, provider_->connect(printerConfig.uri));
                Logger::logInfo("[ServiceContext] Trying " + printerId + ": " + printerConfig.uri + ", OK");
            } catch (const types::DriverException &e) {
                Logger::logWarning("[ServiceContext] Trying " + printerId + ": " + printerConfig.uri +
                                   ", failed: " + e.what());
            }
        }

        auto printers = options.printers;
        for (const auto &[printerId, uri]: registry_.uris()) {
            printers[printerId] = config::PrinterConfig{uri};
        }
        config_.setPrinters(printers);
        config_.save();

        Logger::logInfo("[ServiceContext] Detecting done. Found " + std::to_string(registry_.size()) +
                        " available printer(s).");
        ready_ = true;
        return true;
    }

    bool ServiceContext::configurePrinter(const std::string &printerId, const std::string &uri) {
        if (printerId.empty() || uri.empty()) {
            Logger::logWarning("[ServiceContext] Printer id and URI are required");
            return false;
        }

        std::lock_guard<std::mutex> lock(detectMutex_);
        auto options = config_.options();
        options.printers[printerId] = config::PrinterConfig{uri};
        config_.setPrinters(options.printers);
        Logger::logInfo("[ServiceContext] Configured printer " + printerId + ": " + uri);
        return config_.save();
    }

    bool ServiceContext::deletePrinter(const std::string &printerId) {
        if (printerId.empty()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(detectMutex_);
        auto options = config_.options();
        if (options.printers.erase(printerId) == 0) {
            Logger::logWarning("[ServiceContext] Cannot delete unknown printer " + printerId);
            return false;
        }
        config_.setPrinters(options.printers);
        Logger::logInfo("[ServiceContext] Deleted printer " + printerId);
        return config_.save();
    }

    std::map<std::string, model::DeviceInfo> ServiceContext::printersInfo() const {
        return registry_.printersInfo();
    }

    std::shared_ptr<driver::FiscalPrinter> ServiceContext::findPrinter(const std::string &printerId) const {
        return registry_.find(printerId);
    }

} // namespace fiscal::service
