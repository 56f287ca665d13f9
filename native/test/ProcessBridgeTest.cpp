#include "ProcessBridge.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <unistd.h>

TEST(ProcessBridgeTest, OnScreenWindowIsNotEvasive) {
    EXPECT_FALSE(IsEvasiveGeometry(0, 0, 800, 600));
    EXPECT_FALSE(IsEvasiveGeometry(-1000, -1000, 1, 1));
    EXPECT_FALSE(IsEvasiveGeometry(10000, 10000, 200, 100));
}

TEST(ProcessBridgeTest, FarOffScreenWindowIsEvasive) {
    EXPECT_TRUE(IsEvasiveGeometry(-1001, 0, 800, 600));
    EXPECT_TRUE(IsEvasiveGeometry(0, -5000, 800, 600));
    EXPECT_TRUE(IsEvasiveGeometry(10001, 0, 800, 600));
    EXPECT_TRUE(IsEvasiveGeometry(0, 12000, 800, 600));
}

TEST(ProcessBridgeTest, DegenerateWindowIsEvasive) {
    EXPECT_TRUE(IsEvasiveGeometry(100, 100, 0, 600));
    EXPECT_TRUE(IsEvasiveGeometry(100, 100, 800, 0.5));
}

TEST(ProcessBridgeTest, LayersAboveNormalAreElevated) {
    EXPECT_FALSE(IsElevatedLayer(0));
    EXPECT_FALSE(IsElevatedLayer(kNormalWindowLayer));
    EXPECT_TRUE(IsElevatedLayer(3));
    EXPECT_TRUE(IsElevatedLayer(25));
}

TEST(ProcessBridgeTest, WindowQueriesRejectNonPositivePid) {
    std::shared_ptr<WindowInspector> windows = CreateSystemWindowInspector();

    EXPECT_THROW(windows->WindowCount(0), std::invalid_argument);
    EXPECT_THROW(windows->DetectScreenEvasion(-1), std::invalid_argument);
    EXPECT_THROW(windows->DetectElevatedLayers(0), std::invalid_argument);
    EXPECT_THROW(windows->GetWindowProperties(-42), std::invalid_argument);
}

TEST(ProcessBridgeTest, ProcessTableContainsCurrentProcess) {
    std::shared_ptr<ProcessInspector> processes = CreateSystemProcessInspector(CreateSystemWindowInspector());
    std::vector<ProcessSnapshot> table = processes->ListProcesses();

    ASSERT_FALSE(table.empty());

    bool foundSelf = false;
    for (const auto& process : table) {
        EXPECT_GT(process.pid, 0);
        EXPECT_FALSE(process.name.empty());
        if (process.pid == getpid()) {
            foundSelf = true;
        }
    }
    EXPECT_TRUE(foundSelf);
}

TEST(ProcessBridgeTest, CurrentProcessHasExecutablePath) {
    std::shared_ptr<ProcessInspector> processes = CreateSystemProcessInspector(CreateSystemWindowInspector());

    EXPECT_FALSE(processes->GetProcessPath(getpid()).empty());
    EXPECT_TRUE(processes->GetProcessPath(0).empty());
}

#ifndef __APPLE__
TEST(ProcessBridgeTest, NoCompositorRegistryOffMac) {
    std::shared_ptr<WindowInspector> windows = CreateSystemWindowInspector();
    std::shared_ptr<ProcessInspector> processes = CreateSystemProcessInspector(windows);

    EXPECT_FALSE(windows->IsAvailable());
    EXPECT_EQ(windows->WindowCount(getpid()), 0);
    EXPECT_TRUE(processes->ListGuiApplications().empty());
}
#endif
