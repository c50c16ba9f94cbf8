#include "fiscal/provider/Provider.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "fiscal/driver/EltradeIslDriver.hpp"
#include "fiscal/driver/IslDriver.hpp"
#include "fiscal/driver/ZfpDriver.hpp"
#include "fiscal/transport/SerialChannel.hpp"
#include "fiscal/types/Error.hpp"
#include "logger/Logger.hpp"

namespace fiscal::provider {

    namespace {
        constexpr const char *URI_SEPARATOR = "://";
        constexpr const char *PROTOCOL_SUFFIX = ".com";
        const std::vector<std::string> CANDIDATE_PREFIXES = {"ttyUSB", "ttyACM"};

        template<typename Driver>
        Provider::DriverFactory driverFactory() {
            return [](std::unique_ptr<transport::Channel> channel, const driver::DriverOptions &options) {
                return std::unique_ptr<driver::FiscalPrinter>(
                    std::make_unique<Driver>(std::move(channel), options));
            };
        }
    }

    ParsedUri parseUri(const std::string &uri, const std::string &deviceDirectory) {
        auto separator = uri.find(URI_SEPARATOR);
        if (separator == std::string::npos) {
            throw std::invalid_argument("Invalid printer URI: " + uri);
        }

        std::string scheme = uri.substr(0, separator);
        const std::string suffix = PROTOCOL_SUFFIX;
        if (scheme.size() <= suffix.size() ||
            scheme.compare(scheme.size() - suffix.size(), suffix.size(), suffix) != 0) {
            throw std::invalid_argument("Invalid printer URI protocol: " + uri);
        }

        ParsedUri parsed;
        parsed.protocol = scheme.substr(0, scheme.size() - suffix.size());
        parsed.port = uri.substr(separator + std::char_traits<char>::length(URI_SEPARATOR));
        if (parsed.port.empty()) {
            throw std::invalid_argument("Printer URI has no port: " + uri);
        }
        if (parsed.port.front() != '/' && parsed.port.find(':') == std::string::npos) {
            parsed.port = deviceDirectory + "/" + parsed.port;
        }
        return parsed;
    }

    std::string makeUri(const std::string &protocol, const std::string &port) {
        return protocol + PROTOCOL_SUFFIX + URI_SEPARATOR + port;
    }

    Provider::Provider(ProviderOptions options, ChannelFactory channelFactory)
        : options_(std::move(options)), channelFactory_(std::move(channelFactory)) {
        if (!channelFactory_) {
            auto baudRate = options_.baudRate;
            auto readTimeout = options_.readTimeout;
            channelFactory_ = [baudRate, readTimeout](const std::string &port, const std::string &frameFormat) {
                return std::unique_ptr<transport::Channel>(std::make_unique<transport::SerialChannel>(
                    port, baudRate, transport::makeFrameFormat(frameFormat), readTimeout));
            };
        }

        registerProtocol("bg.zk.zfp", "zfp", driverFactory<driver::ZfpDriver>());
        registerProtocol("bg.dt.isl", "isl", driverFactory<driver::IslDriver>());
        registerProtocol("bg.ed.isl", "isl", driverFactory<driver::EltradeIslDriver>());
    }

    void Provider::registerProtocol(const std::string &protocol, const std::string &frameFormat,
                                    DriverFactory factory) {
        if (protocols_.count(protocol) == 0) {
            protocolOrder_.push_back(protocol);
        }
        protocols_[protocol] = Protocol{frameFormat, std::move(factory)};
    }

    std::vector<std::string> Provider::protocols() const {
        return protocolOrder_;
    }

    std::shared_ptr<driver::FiscalPrinter> Provider::connect(const std::string &uri) {
        ParsedUri parsed;
        try {
            parsed = parseUri(uri, options_.deviceDirectory);
        } catch (const std::invalid_argument &e) {
            throw types::ConnectionException(e.what());
        }

        auto it = protocols_.find(parsed.protocol);
        if (it == protocols_.end()) {
            throw types::ConnectionException("Unsupported protocol " + parsed.protocol + " in " + uri);
        }

        auto channel = channelFactory_(parsed.port, it->second.frameFormat);
        std::shared_ptr<driver::FiscalPrinter> printer = it->second.factory(std::move(channel),
                                                                            options_.driverOptions);

        auto [info, status] = printer->readDeviceInfo();
        if (!status.ok() || info.serialNumber.empty()) {
            std::string reason = status.messages().empty() ? "no serial number" : status.messages().back().text;
            throw types::ConnectionException("Device at " + uri + " did not identify itself: " + reason);
        }

        info.uri = uri;
        printer->setDeviceInfo(info);

        auto remapping = options_.paymentTypeRemapping.find(info.serialNumber);
        if (remapping != options_.paymentTypeRemapping.end()) {
            printer->setPaymentTypeOverrides(remapping->second);
        }

        Logger::logInfo("[Provider] Connected " + info.manufacturer + " " + info.model + " " +
                        info.serialNumber + " at " + uri);
        return printer;
    }

    std::vector<std::string> Provider::candidatePorts() const {
        std::vector<std::string> ports;
        std::error_code ec;
        for (const auto &entry: std::filesystem::directory_iterator(options_.deviceDirectory, ec)) {
            auto name = entry.path().filename().string();
            for (const auto &prefix: CANDIDATE_PREFIXES) {
                if (name.compare(0, prefix.size(), prefix) == 0) {
                    ports.push_back(entry.path().string());
                    break;
                }
            }
        }
        if (ec) {
            Logger::logWarning("[Provider] Cannot list " + options_.deviceDirectory + ": " + ec.message());
        }
        std::sort(ports.begin(), ports.end());
        return ports;
    }

    std::map<std::string, std::shared_ptr<driver::FiscalPrinter>> Provider::detectAvailablePrinters() {
        std::map<std::string, std::shared_ptr<driver::FiscalPrinter>> found;
        for (const auto &port: candidatePorts()) {
            for (const auto &protocol: protocolOrder_) {
                auto uri = makeUri(protocol, port);
                try {
                    found[uri] = connect(uri);
                    break;
                } catch (const types::DriverException &e) {
                    Logger::logInfo("[Provider] " + uri + " not answering: " + e.what());
                }
            }
        }
        Logger::logInfo("[Provider] Auto detect found " + std::to_string(found.size()) + " printer(s)");
        return found;
    }

} // namespace fiscal::provider
