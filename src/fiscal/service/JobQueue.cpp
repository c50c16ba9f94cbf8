#include "fiscal/service/JobQueue.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "fiscal/types/Error.hpp"
#include "fiscal/utils/IdGenerator.hpp"
#include "logger/Logger.hpp"

namespace fiscal::service {

    JobQueue::JobQueue(Executor executor, size_t maxCompletedJobs, std::chrono::milliseconds defaultTimeout)
        : executor_(std::move(executor)),
          maxCompletedJobs_(maxCompletedJobs),
          defaultTimeout_(defaultTimeout) {
        if (!executor_) {
            throw std::invalid_argument("JobQueue executor cannot be empty");
        }
    }

    JobQueue::~JobQueue() {
        stop();
    }

    void JobQueue::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        if (worker_.joinable()) {
            worker_.join();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            Logger::logWarning("[JobQueue] Stopped with " + std::to_string(queue_.size()) + " job(s) pending");
        }
    }

    std::string JobQueue::enqueue(std::shared_ptr<driver::FiscalPrinter> printer,
                                  PrintJobAction action,
                                  Document document) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("JobQueue is stopped");
        }

        std::string taskId = utils::generateUrlSafeId();
        while (jobs_.count(taskId) > 0) {
            taskId = utils::generateUrlSafeId();
        }

        PrintJob job;
        job.taskId = taskId;
        job.printer = std::move(printer);
        job.action = action;
        job.document = std::move(document);
        jobs_.emplace(taskId, std::move(job));
        queue_.push_back(taskId);

        Logger::logInfo("[JobQueue] Enqueued " + printJobActionToString(action) + " as " + taskId);
        ensureWorker();
        return taskId;
    }

    void JobQueue::ensureWorker() {
        if (workerRunning_) return;

        // previous worker already left its loop
        if (worker_.joinable()) {
            worker_.join();
        }
        workerRunning_ = true;
        worker_ = std::thread([this]() {
            workerLoop();
        });
    }

    void JobQueue::workerLoop() {
        while (true) {
            PrintJob *job = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_ || queue_.empty()) {
                    workerRunning_ = false;
                    return;
                }
                auto taskId = queue_.front();
                queue_.pop_front();
                auto it = jobs_.find(taskId);
                if (it == jobs_.end()) continue;
                job = &it->second;
                job->status = TaskStatus::Running;
                job->lastUpdate = std::chrono::steady_clock::now();
            }

            Logger::logInfo("[JobQueue] Running " + printJobActionToString(job->action) + " " + job->taskId);

            // only the worker touches a running job, cleanup skips unfinished ones
            nlohmann::json result;
            try {
                result = executor_(*job);
            } catch (const std::exception &e) {
                Logger::logError("[JobQueue] Job " + job->taskId + " failed: " + e.what());
                types::DeviceStatus status;
                status.addError(types::codes::GeneralError, e.what());
                result = status;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                job->result = std::move(result);
                job->status = TaskStatus::Finished;
                job->finished = std::chrono::system_clock::now();
                job->lastUpdate = std::chrono::steady_clock::now();
                Logger::logInfo("[JobQueue] Finished " + job->taskId);
                cleanupCompletedJobs(job->taskId);
            }
            finishedCondition_.notify_all();
        }
    }

    RunOutcome JobQueue::run(std::shared_ptr<driver::FiscalPrinter> printer,
                             PrintJobAction action,
                             Document document,
                             int timeoutMs) {
        RunOutcome outcome;
        outcome.taskId = enqueue(std::move(printer), action, std::move(document));
        if (timeoutMs == 0) {
            return outcome;
        }

        auto timeout = timeoutMs < 0 ? defaultTimeout_ : std::chrono::milliseconds(timeoutMs);
        if (waitForCompletion(outcome.taskId, timeout)) {
            auto info = getTaskInfo(outcome.taskId);
            if (info.taskStatus == TaskStatus::Finished) {
                outcome.result = info.result;
            }
        }
        return outcome;
    }

    bool JobQueue::waitForCompletion(const std::string &taskId, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return finishedCondition_.wait_for(lock, timeout, [this, &taskId]() {
            auto it = jobs_.find(taskId);
            // evicted jobs are finished ones
            return it == jobs_.end() || it->second.status == TaskStatus::Finished;
        });
    }

    TaskInfo JobQueue::getTaskInfo(const std::string &taskId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        TaskInfo info;
        auto it = jobs_.find(taskId);
        if (it != jobs_.end()) {
            info.taskStatus = it->second.status;
            info.result = it->second.result;
        }
        return info;
    }

    size_t JobQueue::pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto &entry) {
            return entry.second.status != TaskStatus::Finished;
        }));
    }

    size_t JobQueue::jobCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    void JobQueue::cleanupCompletedJobs(const std::string &justFinished) {
        std::vector<std::pair<std::string, std::chrono::steady_clock::time_point> > completed;
        for (const auto &[id, job]: jobs_) {
            // its waiters have not read the result yet
            if (id == justFinished) continue;
            if (job.status == TaskStatus::Finished) {
                completed.emplace_back(id, job.lastUpdate);
            }
        }

        // the just finished job counts towards the limit
        size_t keep = maxCompletedJobs_ > 0 ? maxCompletedJobs_ - 1 : 0;
        if (completed.size() > keep) {
            std::sort(completed.begin(), completed.end(),
                      [](const auto &a, const auto &b) { return a.second < b.second; });

            size_t toRemove = completed.size() - keep;
            for (size_t i = 0; i < toRemove; ++i) {
                jobs_.erase(completed[i].first);
            }
        }
    }

} // namespace fiscal::service
