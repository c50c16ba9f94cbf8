#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "fiscal/service/PrintJob.hpp"

namespace fiscal::service {

    constexpr size_t DEFAULT_MAX_COMPLETED_JOBS = 100;

    struct RunOutcome {
        std::string taskId;
        // present when the job finished within the timeout
        std::optional<nlohmann::json> result;
    };

    /**
     * @brief FIFO of print jobs executed by a single worker thread.
     *
     * Only one job runs at a time across all printers. The worker is started
     * lazily on enqueue and exits when the queue drains.
     */
    class JobQueue {
    public:
        using Executor = std::function<nlohmann::json(const PrintJob &)>;

        explicit JobQueue(Executor executor = runPrintJob,
                          size_t maxCompletedJobs = DEFAULT_MAX_COMPLETED_JOBS,
                          std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds(DEFAULT_TIMEOUT_MS));

        ~JobQueue();

        JobQueue(const JobQueue &) = delete;

        JobQueue &operator=(const JobQueue &) = delete;

        /**
         * @brief Queues the job and returns its task id without waiting
         */
        std::string enqueue(std::shared_ptr<driver::FiscalPrinter> printer,
                            PrintJobAction action,
                            Document document = std::monostate{});

        /**
         * @brief Enqueue and wait: timeoutMs == 0 returns at once, < 0 waits the default timeout
         */
        RunOutcome run(std::shared_ptr<driver::FiscalPrinter> printer,
                       PrintJobAction action,
                       Document document,
                       int timeoutMs);

        bool waitForCompletion(const std::string &taskId, std::chrono::milliseconds timeout);

        TaskInfo getTaskInfo(const std::string &taskId) const;

        /**
         * @brief Jobs enqueued or running, not yet finished
         */
        size_t pendingCount() const;

        size_t jobCount() const;

        void stop();

    private:
        Executor executor_;
        size_t maxCompletedJobs_;
        std::chrono::milliseconds defaultTimeout_;

        mutable std::mutex mutex_;
        std::condition_variable finishedCondition_;
        std::unordered_map<std::string, PrintJob> jobs_;
        std::deque<std::string> queue_;
        std::thread worker_;
        bool workerRunning_ = false;
        bool stopping_ = false;

        void ensureWorker();

        void workerLoop();

        void cleanupCompletedJobs(const std::string &justFinished);
    };

} // namespace fiscal::service
