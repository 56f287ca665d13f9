#include "ScanScheduler.h"

#include <iostream>

PeriodicTask::PeriodicTask(const std::string& name, int intervalMs, std::function<void()> task)
    : name_(name), intervalMs_(intervalMs > 0 ? intervalMs : 1), task_(task),
      running_(false), runCount_(0), cancelled_(false) {
}

PeriodicTask::~PeriodicTask() {
    Cancel();
}

void PeriodicTask::Start() {
    if (running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
    }

    running_ = true;
    worker_thread_ = std::thread(&PeriodicTask::WorkerLoop, this);
}

void PeriodicTask::RequestCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    wake_.notify_all();
}

void PeriodicTask::Cancel() {
    RequestCancel();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    running_ = false;
}

bool PeriodicTask::IsRunning() const {
    return running_.load();
}

int PeriodicTask::RunCount() const {
    return runCount_.load();
}

void PeriodicTask::WorkerLoop() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                break;
            }
        }

        try {
            task_();
        } catch (const std::exception& e) {
            std::cerr << "[ScanScheduler] " << name_ << " cycle failed: " << e.what() << std::endl;
        }
        runCount_++;

        std::unique_lock<std::mutex> lock(mutex_);
        if (wake_.wait_for(lock, std::chrono::milliseconds(intervalMs_),
                           [this]() { return cancelled_; })) {
            break;
        }
    }
}

ScanScheduler::ScanScheduler() {
}

ScanScheduler::~ScanScheduler() {
    CancelAll();
    WaitForRetired();
}

void ScanScheduler::Schedule(const std::string& name, int intervalMs, std::function<void()> task) {
    std::shared_ptr<PeriodicTask> periodic = std::make_shared<PeriodicTask>(name, intervalMs, task);
    periodic->Start();

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(periodic);

    std::cout << "[ScanScheduler] Scheduled " << name << " every " << intervalMs << "ms" << std::endl;
}

void ScanScheduler::CancelAll() {
    std::vector<std::shared_ptr<PeriodicTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    if (tasks.empty()) {
        return;
    }

    for (auto& task : tasks) {
        task->RequestCancel();
    }

    // The reaper owns the last references, so a slow run never blocks the caller
    std::lock_guard<std::mutex> lock(reaperMutex_);
    reapers_.push_back(std::thread([tasks]() {
        for (auto& task : tasks) {
            task->Cancel();
        }
    }));
}

void ScanScheduler::WaitForRetired() {
    std::vector<std::thread> reapers;
    {
        std::lock_guard<std::mutex> lock(reaperMutex_);
        reapers.swap(reapers_);
    }

    for (auto& reaper : reapers) {
        if (reaper.joinable()) {
            reaper.join();
        }
    }
}

size_t ScanScheduler::TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}
