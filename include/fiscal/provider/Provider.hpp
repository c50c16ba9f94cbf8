#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "fiscal/driver/ProtocolDriver.hpp"
#include "fiscal/transport/Channel.hpp"

namespace fiscal::provider {

    struct ProviderOptions {
        uint32_t baudRate = 115200;
        std::chrono::milliseconds readTimeout{800};
        driver::DriverOptions driverOptions;
        // serial number -> payment type -> vendor token
        std::map<std::string, std::map<model::PaymentType, std::string>> paymentTypeRemapping;
        std::string deviceDirectory = "/dev";
    };

    struct ParsedUri {
        std::string protocol;
        std::string port;
    };

    /**
     * @brief Splits "<protocol>.com://<port>"; a bare port name is resolved under deviceDirectory
     * @throws std::invalid_argument when the URI has no "://" or the protocol part is not "*.com"
     */
    ParsedUri parseUri(const std::string &uri, const std::string &deviceDirectory = "/dev");

    std::string makeUri(const std::string &protocol, const std::string &port);

    /**
     * @brief Knows every supported protocol and turns URIs into connected printers
     */
    class Provider {
    public:
        // opens the channel for a port with the given frame format ("zfp" / "isl")
        using ChannelFactory = std::function<std::unique_ptr<transport::Channel>(const std::string &port,
                                                                                 const std::string &frameFormat)>;
        using DriverFactory = std::function<std::unique_ptr<driver::FiscalPrinter>(
            std::unique_ptr<transport::Channel> channel, const driver::DriverOptions &options)>;

        explicit Provider(ProviderOptions options, ChannelFactory channelFactory = nullptr);

        void registerProtocol(const std::string &protocol, const std::string &frameFormat, DriverFactory factory);

        std::vector<std::string> protocols() const;

        /**
         * @brief Opens the device, identifies it and applies its payment remapping
         * @throws types::ConnectionException when the device cannot be opened or identified
         */
        std::shared_ptr<driver::FiscalPrinter> connect(const std::string &uri);

        /**
         * @brief Probes every candidate port with every protocol; keyed by URI
         */
        std::map<std::string, std::shared_ptr<driver::FiscalPrinter>> detectAvailablePrinters();

        std::vector<std::string> candidatePorts() const;

        const ProviderOptions &options() const {
            return options_;
        }

    private:
        struct Protocol {
            std::string frameFormat;
            DriverFactory factory;
        };

        ProviderOptions options_;
        ChannelFactory channelFactory_;
        std::map<std::string, Protocol> protocols_;
        std::vector<std::string> protocolOrder_;
    };

} // namespace fiscal::provider
