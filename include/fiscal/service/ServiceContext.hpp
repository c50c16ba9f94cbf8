#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "application/config/ConfigManager.hpp"
#include "fiscal/provider/Provider.hpp"
#include "fiscal/registry/PrinterRegistry.hpp"
#include "fiscal/service/JobQueue.hpp"

namespace fiscal::service {

    /**
     * @brief Owns the printer registry and the job queue for one service instance.
     *
     * Built once at startup and handed to whatever exposes the service;
     * there is no global instance.
     */
    class ServiceContext {
    public:
        ServiceContext(config::ConfigManager &config, std::unique_ptr<provider::Provider> provider,
                       JobQueue::Executor executor = runPrintJob);

        ~ServiceContext();

        /**
         * @brief Reads the options (generating the server id), marks the service ready and detects printers
         */
        void setup();

        /**
         * @brief Runs an action on a known printer; unknown printers give an E403 result
         */
        RunOutcome run(const std::string &printerId, PrintJobAction action, Document document, int timeoutMs);

        TaskInfo getTaskInfo(const std::string &taskId) const;

        /**
         * @brief Rebuilds the registry from auto detection and the configured printers.
         *
         * Skipped (returns false) while jobs are pending or another detect is running.
         */
        bool detect(bool forceAutoDetect = false);

        bool configurePrinter(const std::string &printerId, const std::string &uri);

        bool deletePrinter(const std::string &printerId);

        std::map<std::string, model::DeviceInfo> printersInfo() const;

        std::shared_ptr<driver::FiscalPrinter> findPrinter(const std::string &printerId) const;

        bool isReady() const {
            return ready_.load();
        }

        std::string serverId() const;

        JobQueue &queue() {
            return queue_;
        }

    private:
        config::ConfigManager &config_;
        std::unique_ptr<provider::Provider> provider_;
        registry::PrinterRegistry registry_;
        JobQueue queue_;

        std::mutex detectMutex_;
        std::atomic<bool> ready_{false};
        mutable std::mutex serverIdMutex_;
        std::string serverId_;
    };

} // namespace fiscal::service
