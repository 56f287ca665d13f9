#ifndef MOCK_INSPECTORS_H
#define MOCK_INSPECTORS_H

#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "ConnectionSnapshot.h"
#include "ProcessBridge.h"

namespace TestMocks {

class MockWindowInspector : public WindowInspector {
public:
    MockWindowInspector() : available_(true), queryCount_(0) {}

    bool IsAvailable() const override { return available_; }

    int WindowCount(int pid) override {
        return GetWindowProperties(pid).windowCount;
    }

    int DetectScreenEvasion(int pid) override {
        RequirePid(pid);
        queryCount_++;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = evasion_.find(pid);
        return it == evasion_.end() ? 0 : it->second;
    }

    int DetectElevatedLayers(int pid) override {
        RequirePid(pid);
        queryCount_++;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = elevated_.find(pid);
        return it == elevated_.end() ? 0 : it->second;
    }

    WindowProperties GetWindowProperties(int pid) override {
        RequirePid(pid);
        queryCount_++;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = properties_.find(pid);
        return it == properties_.end() ? WindowProperties() : it->second;
    }

    void setAvailable(bool available) { available_ = available; }

    void setProperties(int pid, int windowCount, int sharingStateDisabled, int elevatedLayers,
                       int suspiciousPatterns = 0) {
        WindowProperties properties;
        properties.windowCount = windowCount;
        properties.sharingStateDisabled = sharingStateDisabled;
        properties.elevatedLayers = elevatedLayers;
        properties.suspiciousPatterns = suspiciousPatterns;
        std::lock_guard<std::mutex> lock(mutex_);
        properties_[pid] = properties;
    }

    void setScreenEvasion(int pid, int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        evasion_[pid] = count;
    }

    void setElevatedLayers(int pid, int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        elevated_[pid] = count;
    }

    int queryCount() const { return queryCount_.load(); }

private:
    bool available_;
    std::atomic<int> queryCount_;
    std::mutex mutex_;
    std::map<int, WindowProperties> properties_;
    std::map<int, int> evasion_;
    std::map<int, int> elevated_;

    static void RequirePid(int pid) {
        if (pid <= 0) {
            throw std::invalid_argument("pid must be positive");
        }
    }
};

class MockProcessInspector : public ProcessInspector {
public:
    MockProcessInspector() : failing_(false), listCount_(0) {}

    std::vector<ProcessSnapshot> ListProcesses() override {
        listCount_++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            throw BridgeException(BridgeStatus::SystemCall, "process table unavailable");
        }
        return processes_;
    }

    std::vector<GuiApplication> ListGuiApplications() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return apps_;
    }

    std::string GetProcessPath(int pid) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& process : processes_) {
            if (process.pid == pid) {
                return process.path;
            }
        }
        return "";
    }

    void setProcesses(const std::vector<ProcessSnapshot>& processes) {
        std::lock_guard<std::mutex> lock(mutex_);
        processes_ = processes;
    }

    void setGuiApplications(const std::vector<GuiApplication>& apps) {
        std::lock_guard<std::mutex> lock(mutex_);
        apps_ = apps;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    int listCount() const { return listCount_.load(); }

private:
    std::mutex mutex_;
    std::vector<ProcessSnapshot> processes_;
    std::vector<GuiApplication> apps_;
    bool failing_;
    std::atomic<int> listCount_;
};

class MockConnectionSource : public ConnectionSource {
public:
    MockConnectionSource() : succeed_(true) {}

    bool ListEstablished(std::string& output) override {
        std::lock_guard<std::mutex> lock(mutex_);
        output = succeed_ ? output_ : "";
        return succeed_;
    }

    void setOutput(const std::string& output) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = output;
    }

    void setSucceed(bool succeed) {
        std::lock_guard<std::mutex> lock(mutex_);
        succeed_ = succeed;
    }

private:
    std::mutex mutex_;
    std::string output_;
    bool succeed_;
};

class MockHostResolver : public HostResolver {
public:
    MockHostResolver() : resolveCount_(0) {}

    std::string Resolve(const std::string& host) override {
        resolveCount_++;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = names_.find(host);
        return it == names_.end() ? "" : it->second;
    }

    void setName(const std::string& ip, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        names_[ip] = name;
    }

    int resolveCount() const { return resolveCount_.load(); }

private:
    std::atomic<int> resolveCount_;
    std::mutex mutex_;
    std::map<std::string, std::string> names_;
};

inline ProcessSnapshot makeProcess(int pid, const std::string& name, const std::string& path = "",
                                   int windowCount = 1, int suspiciousWindows = 0,
                                   int screenEvasion = 0, int elevatedLayers = 0) {
    ProcessSnapshot process(pid, name, path);
    process.windowCount = windowCount;
    process.suspiciousWindowCount = suspiciousWindows;
    process.screenEvasionCount = screenEvasion;
    process.elevatedLayerCount = elevatedLayers;
    return process;
}

} // namespace TestMocks

#endif // MOCK_INSPECTORS_H
