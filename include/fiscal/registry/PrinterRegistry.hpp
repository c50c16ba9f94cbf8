#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "fiscal/driver/FiscalPrinter.hpp"

namespace fiscal::registry {

    /**
     * @brief Connected printers indexed by id.
     *
     * Auto detected printers get the lower-cased serial number as id; the same
     * serial on another URI gets a "_1", "_2"... suffix, the same serial on the
     * same URI is ignored.
     */
    class PrinterRegistry {
    public:
        /**
         * @brief Adds an auto detected printer
         * @return The id the printer is known by, empty if it has no serial number
         */
        std::string add(const std::shared_ptr<driver::FiscalPrinter> &printer);

        /**
         * @brief Registers a printer under a configured id, replacing any previous one
         */
        void put(const std::string &printerId, const std::shared_ptr<driver::FiscalPrinter> &printer);

        bool remove(const std::string &printerId);

        void clear();

        std::shared_ptr<driver::FiscalPrinter> find(const std::string &printerId) const;

        std::shared_ptr<driver::FiscalPrinter> findByUri(const std::string &uri) const;

        std::map<std::string, model::DeviceInfo> printersInfo() const;

        /**
         * @brief printer id -> URI, the mapping persisted in the configuration
         */
        std::map<std::string, std::string> uris() const;

        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<driver::FiscalPrinter>> printers_;
    };

} // namespace fiscal::registry
