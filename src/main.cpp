#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <condition_variable>
#include <mutex>

// Global shutdown mechanism
std::atomic<bool> running{true};
std::condition_variable shutdownCondition;
std::mutex shutdownMutex;

void handleSignal(int signal) {
    (void) signal;
    running = false;
    shutdownCondition.notify_all();
}

void waitForShutdownSignal() {
    std::unique_lock<std::mutex> lock(shutdownMutex);
    shutdownCondition.wait(lock, [] { return !running.load(); });
}

int main(int argc, char *argv[]) {
    try {
        std::string configPath = "fiscal-printer.json";
        if (const char *env = std::getenv("FP_CONFIG")) {
            configPath = env;
        }
        if (argc > 1) {
            configPath = argv[1];
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        ApplicationController app(configPath);
        if (!app.initialize()) {
            Logger::logError("Application initialization failed");
            Logger::shutdown();
            return 1;
        }

        waitForShutdownSignal();
        Logger::logInfo("Received shutdown signal");

        app.shutdown();
        Logger::shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        return 1;
    }

    return 0;
}
