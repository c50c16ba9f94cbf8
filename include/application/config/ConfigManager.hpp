#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fiscal/model/Enums.hpp"

namespace fiscal::config {
    struct OperatorConfig {
        std::string id = "1";
        std::string password = "0000";
        std::string name = "Operator";
    };

    struct PrinterConfig {
        std::string uri;
    };

    struct QueueConfig {
        size_t maxCompletedJobs = 100;
        int defaultTimeoutMs = 29000;
    };

    struct SerialConfig {
        int baudRate = 115200;
        int readTimeoutMs = 800;
    };

    struct LogConfig {
        std::string directory = "logs";
    };

    struct ServiceOptions {
        std::string serverId;
        bool autoDetect = true;
        OperatorConfig operatorDefaults;
        std::map<std::string, PrinterConfig> printers;
        std::map<std::string, std::map<model::PaymentType, std::string>> paymentTypeRemapping;
        QueueConfig queue;
        SerialConfig serial;
        LogConfig log;
    };

    void to_json(nlohmann::json &j, const ServiceOptions &options);

    /**
     * @brief Missing keys keep their defaults; unknown payment types in the remapping are skipped
     */
    void from_json(const nlohmann::json &j, ServiceOptions &options);

    class ConfigManager {
    public:
        explicit ConfigManager(std::string configPath = "fiscal-printer.json");

        // Load configuration
        void loadFromFile();

        void loadFromEnv();

        /**
         * @brief Writes the whole options object back to the config file
         */
        bool save() const;

        /**
         * @brief Generates and persists a server id if none is configured
         */
        std::string ensureServerId();

        ServiceOptions options() const;

        void setOptions(const ServiceOptions &options);

        void setPrinters(const std::map<std::string, PrinterConfig> &printers);

        const std::string &configPath() const {
            return configPath_;
        }

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        mutable std::mutex configMutex_;
        std::string configPath_;
        ServiceOptions options_;
    };
} // namespace fiscal::config
