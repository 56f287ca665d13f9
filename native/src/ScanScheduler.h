#ifndef SCAN_SCHEDULER_H
#define SCAN_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Runs a task on its own worker thread: once immediately, then every intervalMs
// until cancelled. Exceptions thrown by the task are logged and the next tick proceeds.
class PeriodicTask {
public:
    PeriodicTask(const std::string& name, int intervalMs, std::function<void()> task);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void Start();

    // Wakes the worker without waiting for it; no new run starts afterwards.
    // An in-flight run is left to complete.
    void RequestCancel();

    // RequestCancel, then joins the worker.
    // Must not be called from inside the task.
    void Cancel();

    bool IsRunning() const;
    int RunCount() const;
    const std::string& name() const { return name_; }

private:
    std::string name_;
    int intervalMs_;
    std::function<void()> task_;

    std::atomic<bool> running_;
    std::atomic<int> runCount_;
    std::thread worker_thread_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool cancelled_;

    void WorkerLoop();
};

// Owns the periodic tasks of one monitoring session
class ScanScheduler {
public:
    ScanScheduler();
    ~ScanScheduler();

    void Schedule(const std::string& name, int intervalMs, std::function<void()> task);

    // Signals every task and returns at once. Workers still finishing a run
    // are joined on a reaper thread.
    void CancelAll();

    // Blocks until every cancelled task has finished its last run
    void WaitForRetired();

    size_t TaskCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<PeriodicTask>> tasks_;

    std::mutex reaperMutex_;
    std::vector<std::thread> reapers_;
};

#endif // SCAN_SCHEDULER_H
