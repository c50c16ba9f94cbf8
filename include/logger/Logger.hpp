#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

/**
 * @brief Process wide logger: console always, rotating file once init() has been called
 */
class Logger {
public:
    static void init(const std::string &directory = "logs");

    static void shutdown();

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static std::string logDirectory_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<bool> rotationEnabled_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;
    static std::mutex cleanupMutex_;
    static std::condition_variable cleanupCondition_;

    static void log(const std::string &level, const std::string &message);

    static void rotateLogFile();

    static void startCleanupThread();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
