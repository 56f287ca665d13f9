#include "ScanScheduler.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

// Polls until predicate holds or timeoutMs elapses
template <typename Predicate>
bool WaitFor(Predicate predicate, int timeoutMs = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace

TEST(ScanSchedulerTest, TaskRunsImmediatelyOnStart) {
    std::atomic<int> runs(0);
    PeriodicTask task("immediate", 60000, [&runs]() { runs++; });

    task.Start();
    EXPECT_TRUE(task.IsRunning());
    EXPECT_TRUE(WaitFor([&runs]() { return runs.load() == 1; }));

    task.Cancel();
    EXPECT_FALSE(task.IsRunning());
    EXPECT_EQ(runs.load(), 1);
}

TEST(ScanSchedulerTest, TaskRepeatsAtInterval) {
    std::atomic<int> runs(0);
    PeriodicTask task("repeat", 10, [&runs]() { runs++; });

    task.Start();
    EXPECT_TRUE(WaitFor([&runs]() { return runs.load() >= 3; }));
    task.Cancel();
}

TEST(ScanSchedulerTest, CancelStopsFurtherRuns) {
    std::atomic<int> runs(0);
    PeriodicTask task("cancel", 10, [&runs]() { runs++; });

    task.Start();
    ASSERT_TRUE(WaitFor([&runs]() { return runs.load() >= 1; }));
    task.Cancel();

    int afterCancel = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(runs.load(), afterCancel);
    EXPECT_EQ(task.RunCount(), afterCancel);
}

TEST(ScanSchedulerTest, CancelWakesLongInterval) {
    PeriodicTask task("sleepy", 600000, []() {});
    task.Start();
    ASSERT_TRUE(WaitFor([&task]() { return task.RunCount() == 1; }));

    auto start = std::chrono::steady_clock::now();
    task.Cancel();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ScanSchedulerTest, CancelIsIdempotent) {
    PeriodicTask task("twice", 10, []() {});
    task.Start();
    task.Cancel();
    task.Cancel();
    EXPECT_FALSE(task.IsRunning());
}

TEST(ScanSchedulerTest, CancelledTaskDoesNotRestart) {
    std::atomic<int> runs(0);
    PeriodicTask task("restart", 10, [&runs]() { runs++; });
    task.Cancel();

    task.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(task.IsRunning());
    EXPECT_EQ(runs.load(), 0);
}

TEST(ScanSchedulerTest, ThrowingTaskKeepsItsSchedule) {
    std::atomic<int> attempts(0);
    PeriodicTask task("flaky", 10, [&attempts]() {
        attempts++;
        throw std::runtime_error("scan failed");
    });

    task.Start();
    EXPECT_TRUE(WaitFor([&attempts]() { return attempts.load() >= 3; }));
    task.Cancel();
}

TEST(ScanSchedulerTest, SchedulerOwnsAndCancelsAllTasks) {
    std::atomic<int> first(0);
    std::atomic<int> second(0);
    ScanScheduler scheduler;

    scheduler.Schedule("first", 10, [&first]() { first++; });
    scheduler.Schedule("second", 10, [&second]() { second++; });
    EXPECT_EQ(scheduler.TaskCount(), 2u);
    EXPECT_TRUE(WaitFor([&first, &second]() { return first.load() >= 2 && second.load() >= 2; }));

    scheduler.CancelAll();
    EXPECT_EQ(scheduler.TaskCount(), 0u);
    scheduler.WaitForRetired();

    int firstAfter = first.load();
    int secondAfter = second.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(first.load(), firstAfter);
    EXPECT_EQ(second.load(), secondAfter);
}

TEST(ScanSchedulerTest, RequestCancelDoesNotWaitForRun) {
    std::atomic<bool> release(false);
    std::atomic<int> runs(0);
    PeriodicTask task("blocked", 10, [&release, &runs]() {
        runs++;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    task.Start();
    ASSERT_TRUE(WaitFor([&runs]() { return runs.load() == 1; }));
    task.RequestCancel();
    EXPECT_TRUE(task.IsRunning());

    release = true;
    task.Cancel();
    EXPECT_FALSE(task.IsRunning());
    EXPECT_EQ(runs.load(), 1);
}

TEST(ScanSchedulerTest, CancelAllReturnsWhileRunInFlight) {
    std::atomic<bool> entered(false);
    std::atomic<int> finished(0);
    ScanScheduler scheduler;

    scheduler.Schedule("slow", 10, [&entered, &finished]() {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        finished++;
    });
    ASSERT_TRUE(WaitFor([&entered]() { return entered.load(); }));

    auto start = std::chrono::steady_clock::now();
    scheduler.CancelAll();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(200));
    EXPECT_EQ(scheduler.TaskCount(), 0u);

    scheduler.WaitForRetired();
    EXPECT_EQ(finished.load(), 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(finished.load(), 1);
}
