#include "fiscal/registry/PrinterRegistry.hpp"

#include "fiscal/utils/TextUtils.hpp"
#include "logger/Logger.hpp"

namespace fiscal::registry {

    std::string PrinterRegistry::add(const std::shared_ptr<driver::FiscalPrinter> &printer) {
        if (!printer) return "";
        const auto &info = printer->deviceInfo();
        if (info.serialNumber.empty()) {
            Logger::logWarning("[PrinterRegistry] Ignoring printer without serial number at " + info.uri);
            return "";
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const std::string baseId = utils::toLower(info.serialNumber);
        std::string printerId = baseId;
        int duplicateNumber = 0;
        for (auto it = printers_.find(printerId); it != printers_.end(); it = printers_.find(printerId)) {
            if (it->second->deviceInfo().uri == info.uri) {
                return printerId;
            }
            printerId = baseId + "_" + std::to_string(++duplicateNumber);
        }

        printers_[printerId] = printer;
        Logger::logInfo("[PrinterRegistry] Found " + printerId + ": " + info.uri);
        return printerId;
    }

    void PrinterRegistry::put(const std::string &printerId, const std::shared_ptr<driver::FiscalPrinter> &printer) {
        std::lock_guard<std::mutex> lock(mutex_);
        printers_[printerId] = printer;
    }

    bool PrinterRegistry::remove(const std::string &printerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return printers_.erase(printerId) > 0;
    }

    void PrinterRegistry::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        printers_.clear();
    }

    std::shared_ptr<driver::FiscalPrinter> PrinterRegistry::find(const std::string &printerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = printers_.find(printerId);
        return it != printers_.end() ? it->second : nullptr;
    }

    std::shared_ptr<driver::FiscalPrinter> PrinterRegistry::findByUri(const std::string &uri) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, printer]: printers_) {
            if (printer->deviceInfo().uri == uri) return printer;
        }
        return nullptr;
    }

    std::map<std::string, model::DeviceInfo> PrinterRegistry::printersInfo() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, model::DeviceInfo> result;
        for (const auto &[id, printer]: printers_) {
            result[id] = printer->deviceInfo();
        }
        return result;
    }

    std::map<std::string, std::string> PrinterRegistry::uris() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::string> result;
        for (const auto &[id, printer]: printers_) {
            result[id] = printer->deviceInfo().uri;
        }
        return result;
    }

    size_t PrinterRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return printers_.size();
    }

} // namespace fiscal::registry
