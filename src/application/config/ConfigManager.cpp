#include "application/config/ConfigManager.hpp"
#include "fiscal/utils/IdGenerator.hpp"
#include "logger/Logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>

namespace fiscal::config {
    namespace {
        template<typename T>
        void readIfPresent(const nlohmann::json &j, const char *key, T &target) {
            if (j.contains(key) && !j.at(key).is_null()) {
                target = j.at(key).get<T>();
            }
        }

        bool parseBool(const std::string &value) {
            return value == "true" || value == "1" || value == "yes";
        }
    }

    void to_json(nlohmann::json &j, const ServiceOptions &options) {
        nlohmann::json printers = nlohmann::json::object();
        for (const auto &[id, printer]: options.printers) {
            printers[id] = {{"uri", printer.uri}};
        }

        nlohmann::json remapping = nlohmann::json::object();
        for (const auto &[serialNumber, mapping]: options.paymentTypeRemapping) {
            nlohmann::json tokens = nlohmann::json::object();
            for (const auto &[paymentType, token]: mapping) {
                tokens[model::toString(paymentType)] = token;
            }
            remapping[serialNumber] = tokens;
        }

        j = nlohmann::json{
                {"serverId", options.serverId},
                {"autoDetect", options.autoDetect},
                {"operator", {
                        {"id", options.operatorDefaults.id},
                        {"password", options.operatorDefaults.password},
                        {"name", options.operatorDefaults.name}
                }},
                {"printers", printers},
                {"paymentTypeRemapping", remapping},
                {"queue", {
                        {"maxCompletedJobs", options.queue.maxCompletedJobs},
                        {"defaultTimeoutMs", options.queue.defaultTimeoutMs}
                }},
                {"serial", {
                        {"baudRate", options.serial.baudRate},
                        {"readTimeoutMs", options.serial.readTimeoutMs}
                }},
                {"log", {{"directory", options.log.directory}}}
        };
    }

    void from_json(const nlohmann::json &j, ServiceOptions &options) {
        readIfPresent(j, "serverId", options.serverId);
        readIfPresent(j, "autoDetect", options.autoDetect);

        if (j.contains("operator")) {
            const auto &op = j.at("operator");
            readIfPresent(op, "id", options.operatorDefaults.id);
            readIfPresent(op, "password", options.operatorDefaults.password);
            readIfPresent(op, "name", options.operatorDefaults.name);
        }

        if (j.contains("printers")) {
            options.printers.clear();
            for (auto it = j.at("printers").begin(); it != j.at("printers").end(); ++it) {
                PrinterConfig printer;
                readIfPresent(it.value(), "uri", printer.uri);
                options.printers[it.key()] = printer;
            }
        }

        if (j.contains("paymentTypeRemapping")) {
            options.paymentTypeRemapping.clear();
            const auto &remapping = j.at("paymentTypeRemapping");
            for (auto it = remapping.begin(); it != remapping.end(); ++it) {
                auto &mapping = options.paymentTypeRemapping[it.key()];
                for (auto token = it.value().begin(); token != it.value().end(); ++token) {
                    auto paymentType = model::paymentTypeFromString(token.key());
                    if (!paymentType) {
                        Logger::logWarning("[ConfigManager] Unknown payment type in remapping: " + token.key());
                        continue;
                    }
                    mapping[*paymentType] = token.value().get<std::string>();
                }
            }
        }

        if (j.contains("queue")) {
            readIfPresent(j.at("queue"), "maxCompletedJobs", options.queue.maxCompletedJobs);
            readIfPresent(j.at("queue"), "defaultTimeoutMs", options.queue.defaultTimeoutMs);
        }
        if (j.contains("serial")) {
            readIfPresent(j.at("serial"), "baudRate", options.serial.baudRate);
            readIfPresent(j.at("serial"), "readTimeoutMs", options.serial.readTimeoutMs);
        }
        if (j.contains("log")) {
            readIfPresent(j.at("log"), "directory", options.log.directory);
        }
    }

    ConfigManager::ConfigManager(std::string configPath)
        : configPath_(std::move(configPath)) {
    }

    void ConfigManager::loadFromFile() {
        std::lock_guard<std::mutex> lock(configMutex_);

        if (!std::filesystem::exists(configPath_)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath_ + ", using defaults");
            options_ = ServiceOptions{};
            return;
        }

        try {
            std::ifstream file(configPath_);
            nlohmann::json json;
            file >> json;

            ServiceOptions loaded;
            from_json(json, loaded);
            options_ = std::move(loaded);

            Logger::logInfo("[ConfigManager] Loaded " + std::to_string(options_.printers.size()) +
                            " printer(s) from " + configPath_);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config: " + std::string(e.what()));
            options_ = ServiceOptions{};
        }
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        auto apply = [&loaded](const char *name, const std::function<void(const std::string &)> &setter) {
            const char *value = std::getenv(name);
            if (!value) return;
            try {
                setter(value);
                loaded++;
            } catch (const std::exception &e) {
                Logger::logWarning("[ConfigManager] Ignoring " + std::string(name) + "=" + value + ": " + e.what());
            }
        };

        apply("FP_AUTO_DETECT", [this](const std::string &v) { options_.autoDetect = parseBool(v); });
        apply("FP_SERIAL_BAUD_RATE", [this](const std::string &v) { options_.serial.baudRate = std::stoi(v); });
        apply("FP_SERIAL_READ_TIMEOUT_MS",
              [this](const std::string &v) { options_.serial.readTimeoutMs = std::stoi(v); });
        apply("FP_LOG_DIRECTORY", [this](const std::string &v) { options_.log.directory = v; });
        apply("FP_OPERATOR_ID", [this](const std::string &v) { options_.operatorDefaults.id = v; });
        apply("FP_OPERATOR_PASSWORD", [this](const std::string &v) { options_.operatorDefaults.password = v; });

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    bool ConfigManager::save() const {
        std::lock_guard<std::mutex> lock(configMutex_);
        try {
            auto parent = std::filesystem::path(configPath_).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            std::ofstream file(configPath_, std::ios::trunc);
            if (!file) {
                Logger::logError("[ConfigManager] Cannot write " + configPath_);
                return false;
            }
            file << nlohmann::json(options_).dump(4) << std::endl;
            return true;
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to save config: " + std::string(e.what()));
            return false;
        }
    }

    std::string ConfigManager::ensureServerId() {
        std::string serverId;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            if (!options_.serverId.empty()) {
                return options_.serverId;
            }
            options_.serverId = utils::generateUrlSafeId();
            serverId = options_.serverId;
        }
        Logger::logInfo("[ConfigManager] Generated server id " + serverId);
        save();
        return serverId;
    }

    ServiceOptions ConfigManager::options() const {
        std::lock_guard<std::mutex> lock(configMutex_);
        return options_;
    }

    void ConfigManager::setOptions(const ServiceOptions &options) {
        std::lock_guard<std::mutex> lock(configMutex_);
        options_ = options;
    }

    void ConfigManager::setPrinters(const std::map<std::string, PrinterConfig> &printers) {
        std::lock_guard<std::mutex> lock(configMutex_);
        options_.printers = printers;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        std::lock_guard<std::mutex> lock(configMutex_);
        ValidationResult result;

        for (const auto &[id, printer]: options_.printers) {
            if (printer.uri.empty()) {
                result.errors.push_back("printers." + id + ".uri must not be empty");
            }
        }

        if (options_.queue.maxCompletedJobs < 1) {
            result.errors.push_back("queue.maxCompletedJobs must be >= 1");
        }

        if (options_.queue.defaultTimeoutMs <= 0) {
            result.errors.push_back("queue.defaultTimeoutMs must be > 0");
        }

        if (options_.serial.readTimeoutMs <= 0) {
            result.errors.push_back("serial.readTimeoutMs must be > 0");
        }

        if (options_.serial.baudRate <= 0) {
            result.errors.push_back("serial.baudRate must be > 0");
        }

        result.isValid = result.errors.empty();
        return result;
    }
} // namespace fiscal::config
