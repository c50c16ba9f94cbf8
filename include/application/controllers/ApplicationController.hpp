#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "application/config/ConfigManager.hpp"
#include "fiscal/service/ServiceContext.hpp"

/**
 * @class ApplicationController
 * @brief Wires configuration, provider and service context for the fiscal printer server
 *
 * Initialization sequence:
 * 1. Configuration (file, then environment overrides)
 * 2. Provider with the serial and operator settings
 * 3. Service context setup (server id, printer detection)
 */
class ApplicationController {
public:
    explicit ApplicationController(std::string configPath);

    ~ApplicationController();

    /**
     * @return true if the service is ready to accept jobs
     */
    bool initialize();

    void shutdown();

    fiscal::service::ServiceContext &service() {
        return *service_;
    }

private:
    fiscal::config::ConfigManager config_;
    std::unique_ptr<fiscal::service::ServiceContext> service_;
    std::atomic<bool> initializationComplete_;

    std::unique_ptr<fiscal::provider::Provider> createProvider() const;

    void printInitializationSummary();
};
