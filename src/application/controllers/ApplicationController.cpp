#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"

ApplicationController::ApplicationController(std::string configPath)
        : config_(std::move(configPath)),
          initializationComplete_(false) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize() {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] STARTING FISCAL PRINTER SERVER");
    Logger::logInfo("===============================================");

    Logger::logInfo("[ApplicationController] [1/3] Loading configuration from " + config_.configPath());
    config_.loadFromFile();
    config_.loadFromEnv();
    Logger::init(config_.options().log.directory);

    auto validation = config_.validate();
    if (!validation.isValid) {
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController] Invalid configuration: " + error);
        }
        return false;
    }

    Logger::logInfo("[ApplicationController] [2/3] Creating printer provider...");
    try {
        service_ = std::make_unique<fiscal::service::ServiceContext>(config_, createProvider());
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Service creation FAILED: " + std::string(e.what()));
        return false;
    }

    Logger::logInfo("[ApplicationController] [3/3] Detecting printers...");
    service_->setup();

    printInitializationSummary();
    initializationComplete_ = true;
    return service_->isReady();
}

void ApplicationController::shutdown() {
    if (!initializationComplete_) {
        return;
    }
    initializationComplete_ = false;

    Logger::logInfo("[ApplicationController] Shutting down...");
    if (service_) {
        service_->queue().stop();
        service_.reset();
    }
    Logger::logInfo("[ApplicationController] Shutdown complete");
}

std::unique_ptr<fiscal::provider::Provider> ApplicationController::createProvider() const {
    auto options = config_.options();

    fiscal::provider::ProviderOptions providerOptions;
    providerOptions.baudRate = static_cast<uint32_t>(options.serial.baudRate);
    providerOptions.readTimeout = std::chrono::milliseconds(options.serial.readTimeoutMs);
    providerOptions.driverOptions.operatorId = options.operatorDefaults.id;
    providerOptions.driverOptions.operatorPassword = options.operatorDefaults.password;
    providerOptions.driverOptions.operatorName = options.operatorDefaults.name;
    providerOptions.paymentTypeRemapping = options.paymentTypeRemapping;

    return std::make_unique<fiscal::provider::Provider>(providerOptions);
}

void ApplicationController::printInitializationSummary() {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] Server id: " + service_->serverId());
    auto printers = service_->printersInfo();
    Logger::logInfo("[ApplicationController] Printers: " + std::to_string(printers.size()));
    for (const auto &[id, info]: printers) {
        Logger::logInfo("[ApplicationController]   " + id + " -> " + info.uri + " (" + info.manufacturer + " " +
                        info.model + ", FM " + info.fiscalMemorySerialNumber + ")");
    }
    Logger::logInfo("[ApplicationController] " + std::string(service_->isReady() ? "READY" : "NOT READY"));
    Logger::logInfo("===============================================");
}
