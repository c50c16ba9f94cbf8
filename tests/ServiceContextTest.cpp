#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <future>
#include <random>

#include "fiscal/provider/Provider.hpp"
#include "fiscal/service/ServiceContext.hpp"
#include "fiscal/types/Error.hpp"
#include "support/FakeChannel.hpp"

using namespace fiscal;
using fiscal::test::FakeChannel;
using fiscal::test::zfpBody;

namespace fs = std::filesystem;

namespace {
    fs::path makeTempDirectory(const std::string &prefix) {
        std::random_device rd;
        auto path = fs::temp_directory_path() / (prefix + std::to_string(rd()));
        fs::create_directories(path);
        return path;
    }

    void touch(const fs::path &path) {
        std::ofstream(path.string()).put('\n');
    }

    /**
     * @brief Fake serial ports: each scripted port answers one frame format, the rest stay silent
     */
    class FakeDevices {
    public:
        std::shared_ptr<FakeChannel::State> addZfpPrinter(const std::string &port,
                                                          const std::string &serialNumber) {
            auto state = std::make_shared<FakeChannel::State>();
            state->respondTo(0x60, zfpBody(serialNumber + ";50123456"));
            state->respondTo(0x21, zfpBody("FP-01-KL;1.0.2"));
            state->respondTo(0x68, zfpBody("17-05-2024 10:30"));
            devices_[port] = {"zfp", state};
            return state;
        }

        provider::Provider::ChannelFactory factory() {
            return [this](const std::string &port, const std::string &frameFormat) {
                opened_.push_back(port + "@" + frameFormat);
                auto it = devices_.find(port);
                if (it != devices_.end() && it->second.first == frameFormat) {
                    return std::unique_ptr<transport::Channel>(new FakeChannel(it->second.second));
                }
                return std::unique_ptr<transport::Channel>(
                    new FakeChannel(std::make_shared<FakeChannel::State>()));
            };
        }

        const std::vector<std::string> &opened() const {
            return opened_;
        }

    private:
        std::map<std::string, std::pair<std::string, std::shared_ptr<FakeChannel::State> > > devices_;
        std::vector<std::string> opened_;
    };

    class ServiceContextTest : public ::testing::Test {
    protected:
        void SetUp() override {
            root_ = makeTempDirectory("fiscal-service-");
            devDirectory_ = root_ / "dev";
            fs::create_directories(devDirectory_);
            touch(devDirectory_ / "ttyUSB0");
            touch(devDirectory_ / "ttyUSB1");
            touch(devDirectory_ / "ttyS0");
            configPath_ = (root_ / "fiscal-printer.json").string();
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        std::string port(const std::string &name) const {
            return (devDirectory_ / name).string();
        }

        std::unique_ptr<provider::Provider> makeProvider() {
            provider::ProviderOptions options;
            options.deviceDirectory = devDirectory_.string();
            return std::make_unique<provider::Provider>(options, devices_.factory());
        }

        fs::path root_;
        fs::path devDirectory_;
        std::string configPath_;
        FakeDevices devices_;
    };
}

TEST(ProviderUriTest, BarePortIsResolvedUnderDeviceDirectory) {
    auto parsed = provider::parseUri("bg.zk.zfp.com://ttyUSB0");
    EXPECT_EQ(parsed.protocol, "bg.zk.zfp");
    EXPECT_EQ(parsed.port, "/dev/ttyUSB0");
}

TEST(ProviderUriTest, AbsoluteAndNetworkPortsAreKept) {
    EXPECT_EQ(provider::parseUri("bg.dt.isl.com:///dev/ttyACM3").port, "/dev/ttyACM3");
    EXPECT_EQ(provider::parseUri("bg.dt.isl.com://10.0.0.7:9100").port, "10.0.0.7:9100");
}

TEST(ProviderUriTest, MalformedUrisAreRejected) {
    EXPECT_THROW(provider::parseUri("ttyUSB0"), std::invalid_argument);
    EXPECT_THROW(provider::parseUri("bg.zk.zfp://ttyUSB0"), std::invalid_argument);
    EXPECT_THROW(provider::parseUri("bg.zk.zfp.com://"), std::invalid_argument);
}

TEST(ProviderUriTest, MakeUri) {
    EXPECT_EQ(provider::makeUri("bg.ed.isl", "/dev/ttyUSB2"), "bg.ed.isl.com:///dev/ttyUSB2");
}

TEST_F(ServiceContextTest, ProviderKnowsProtocolsInDetectionOrder) {
    auto provider = makeProvider();
    EXPECT_EQ(provider->protocols(), (std::vector<std::string>{"bg.zk.zfp", "bg.dt.isl", "bg.ed.isl"}));
}

TEST_F(ServiceContextTest, CandidatePortsAreSortedSerialAdapters) {
    auto provider = makeProvider();
    EXPECT_EQ(provider->candidatePorts(), (std::vector<std::string>{port("ttyUSB0"), port("ttyUSB1")}));
}

TEST_F(ServiceContextTest, ConnectUnknownProtocolFails) {
    auto provider = makeProvider();
    EXPECT_THROW(provider->connect("xx.yy.zfp.com://ttyUSB0"), types::ConnectionException);
    EXPECT_THROW(provider->connect("not a uri"), types::ConnectionException);
}

TEST_F(ServiceContextTest, ConnectSilentDeviceFails) {
    auto provider = makeProvider();
    EXPECT_THROW(provider->connect("bg.zk.zfp.com://ttyUSB1"), types::ConnectionException);
}

TEST_F(ServiceContextTest, ConnectIdentifiesAndRemapsPayments) {
    auto state = devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");

    provider::ProviderOptions options;
    options.deviceDirectory = devDirectory_.string();
    options.paymentTypeRemapping["ZK123456"] = {{model::PaymentType::Card, "9"}};
    provider::Provider provider(options, devices_.factory());

    auto printer = provider.connect("bg.zk.zfp.com://ttyUSB0");
    EXPECT_EQ(printer->deviceInfo().serialNumber, "ZK123456");
    EXPECT_EQ(printer->deviceInfo().uri, "bg.zk.zfp.com://ttyUSB0");
    EXPECT_EQ(printer->deviceInfo().model, "FP-01-KL");

    state->respondAlways(zfpBody(""));
    printer->addPayment(10, model::PaymentType::Card);
    EXPECT_EQ(state->sent.back().payload, "9;1;10.00*");
}

TEST_F(ServiceContextTest, DetectProbesEveryProtocolOnSilentPorts) {
    devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");
    auto provider = makeProvider();

    auto found = provider->detectAvailablePrinters();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found.begin()->first, "bg.zk.zfp.com://" + port("ttyUSB0"));

    // ttyUSB0 stops at the first protocol, ttyUSB1 tries them all
    EXPECT_EQ(devices_.opened(), (std::vector<std::string>{
                  port("ttyUSB0") + "@zfp",
                  port("ttyUSB1") + "@zfp", port("ttyUSB1") + "@isl", port("ttyUSB1") + "@isl"}));
}

TEST_F(ServiceContextTest, SetupDetectsPrintersAndPersistsConfig) {
    devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");
    config::ConfigManager config(configPath_);
    service::ServiceContext context(config, makeProvider());

    EXPECT_FALSE(context.isReady());
    context.setup();
    EXPECT_TRUE(context.isReady());
    EXPECT_EQ(context.serverId().size(), 22u);

    auto printers = context.printersInfo();
    ASSERT_EQ(printers.size(), 1u);
    EXPECT_EQ(printers.begin()->first, "zk123456");

    config::ConfigManager reloaded(configPath_);
    reloaded.loadFromFile();
    EXPECT_EQ(reloaded.options().serverId, context.serverId());
    EXPECT_EQ(reloaded.options().printers.at("zk123456").uri, "bg.zk.zfp.com://" + port("ttyUSB0"));
}

TEST_F(ServiceContextTest, ConfiguredAliasSharesConnectedPrinter) {
    devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");
    config::ConfigManager config(configPath_);
    auto options = config.options();
    options.printers["front-desk"] = config::PrinterConfig{"bg.zk.zfp.com://" + port("ttyUSB0")};
    options.printers["back-office"] = config::PrinterConfig{"bg.zk.zfp.com://" + port("ttyUSB1")};
    config.setOptions(options);

    service::ServiceContext context(config, makeProvider());
    context.setup();

    EXPECT_EQ(context.findPrinter("front-desk"), context.findPrinter("zk123456"));
    EXPECT_EQ(context.findPrinter("back-office"), nullptr);

    // unreachable printers stay configured
    EXPECT_EQ(config.options().printers.count("back-office"), 1u);
}

TEST_F(ServiceContextTest, ManualOnlyConfigurationSkipsAutoDetect) {
    devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");
    config::ConfigManager config(configPath_);
    auto options = config.options();
    options.autoDetect = false;
    options.printers["till"] = config::PrinterConfig{"bg.zk.zfp.com://ttyUSB0"};
    config.setOptions(options);

    service::ServiceContext context(config, makeProvider());
    context.setup();

    EXPECT_NE(context.findPrinter("till"), nullptr);
    EXPECT_EQ(context.findPrinter("zk123456"), nullptr);
    EXPECT_EQ(context.printersInfo().size(), 1u);
}

TEST_F(ServiceContextTest, ForcedDetectFindsUnconfiguredPrinters) {
    devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");
    config::ConfigManager config(configPath_);
    auto options = config.options();
    options.autoDetect = false;
    config.setOptions(options);

    service::ServiceContext context(config, makeProvider());
    context.setup();
    EXPECT_TRUE(context.printersInfo().empty());

    EXPECT_TRUE(context.detect(true));
    EXPECT_NE(context.findPrinter("zk123456"), nullptr);
}

TEST_F(ServiceContextTest, UnknownPrinterIsRejectedWithoutQueueing) {
    config::ConfigManager config(configPath_);
    service::ServiceContext context(config, makeProvider());
    context.setup();

    auto outcome = context.run("nope", service::PrintJobAction::CheckStatus, {}, 1000);
    ASSERT_TRUE(outcome.result.has_value());
    EXPECT_TRUE(outcome.taskId.empty());
    EXPECT_FALSE((*outcome.result)["ok"].get<bool>());
    EXPECT_EQ((*outcome.result)["messages"][0]["code"].get<std::string>(), "E403");
    EXPECT_EQ((*outcome.result)["messages"][0]["text"].get<std::string>(), "Printer nope not found");
    EXPECT_EQ(context.queue().jobCount(), 0u);
}

TEST_F(ServiceContextTest, RunsStatusCheckOnDevice) {
    auto state = devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");
    config::ConfigManager config(configPath_);
    service::ServiceContext context(config, makeProvider());
    context.setup();

    auto outcome = context.run("zk123456", service::PrintJobAction::CheckStatus, {}, 5000);
    ASSERT_TRUE(outcome.result.has_value());
    EXPECT_TRUE((*outcome.result)["ok"].get<bool>());
    EXPECT_EQ(state->sent.back().opcode, 0x68);
    EXPECT_EQ(context.getTaskInfo(outcome.taskId).taskStatus, service::TaskStatus::Finished);
}

TEST_F(ServiceContextTest, DetectIsSkippedWhileJobsArePending) {
    devices_.addZfpPrinter(port("ttyUSB0"), "ZK123456");
    std::promise<void> gate;
    auto released = gate.get_future().share();

    config::ConfigManager config(configPath_);
    service::ServiceContext context(config, makeProvider(), [released](const service::PrintJob &) {
        released.wait();
        return nlohmann::json{{"ok", true}};
    });
    context.setup();

    auto outcome = context.run("zk123456", service::PrintJobAction::PrintXReport, {}, 0);
    EXPECT_FALSE(context.detect());

    gate.set_value();
    ASSERT_TRUE(context.queue().waitForCompletion(outcome.taskId, std::chrono::seconds(5)));
    EXPECT_TRUE(context.detect());
}

TEST_F(ServiceContextTest, DetectBeforeSetupIsSkipped) {
    config::ConfigManager config(configPath_);
    service::ServiceContext context(config, makeProvider());
    EXPECT_FALSE(context.detect());
}

TEST_F(ServiceContextTest, ConfigureAndDeletePrinters) {
    config::ConfigManager config(configPath_);
    service::ServiceContext context(config, makeProvider());

    EXPECT_FALSE(context.configurePrinter("", "bg.zk.zfp.com://ttyUSB0"));
    EXPECT_FALSE(context.configurePrinter("till", ""));
    EXPECT_TRUE(context.configurePrinter("till", "bg.zk.zfp.com://ttyUSB0"));

    config::ConfigManager reloaded(configPath_);
    reloaded.loadFromFile();
    EXPECT_EQ(reloaded.options().printers.at("till").uri, "bg.zk.zfp.com://ttyUSB0");

    EXPECT_TRUE(context.deletePrinter("till"));
    EXPECT_FALSE(context.deletePrinter("till"));
    EXPECT_FALSE(context.deletePrinter(""));
    EXPECT_TRUE(config.options().printers.empty());
}
