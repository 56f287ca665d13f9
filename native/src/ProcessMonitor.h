#ifndef PROCESS_MONITOR_H
#define PROCESS_MONITOR_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "CommonTypes.h"
#include "ConnectionSnapshot.h"
#include "MonitorConfig.h"
#include "NetworkMonitor.h"
#include "ProcessBridge.h"
#include "ScanScheduler.h"
#include "SuspiciousProcessDetector.h"

enum class MonitorEvent {
    ForbiddenApps,
    SuspiciousProcesses,
    AdvancedDetections,
    NetworkDetections
};

const char* ToString(MonitorEvent event);

// Everything currently published; replaced wholesale by each cycle
struct MonitorSnapshot {
    std::vector<std::string> forbiddenApps;
    std::vector<SuspiciousProcessResult> suspiciousProcesses;
    std::vector<AdvancedDetectionResult> advancedDetections;
    std::vector<NetworkDetectionResult> networkDetections;
};

struct MonitorDependencies {
    std::shared_ptr<ProcessInspector> processes;
    std::shared_ptr<WindowInspector> windows;
    std::shared_ptr<ConnectionSource> connections;
    std::shared_ptr<HostResolver> resolver;
};

// OS-backed process table, compositor, lsof and reverse DNS
MonitorDependencies CreateSystemDependencies(int utilityTimeoutMs = kDefaultUtilityTimeoutMs,
                                             int dnsTimeoutMs = kDefaultDnsTimeoutMs);

class ProcessMonitor {
public:
    // Runs a publish step on the thread that owns the published state
    typedef std::function<void(std::function<void()>)> Dispatcher;
    typedef std::function<void(MonitorEvent, const MonitorSnapshot&)> Listener;

    explicit ProcessMonitor(const MonitorDependencies& deps);
    ~ProcessMonitor();

    ProcessMonitor(const ProcessMonitor&) = delete;
    ProcessMonitor& operator=(const ProcessMonitor&) = delete;

    // Configuration is read when monitoring starts; changes made while
    // active apply to the next session.
    void Configure(const MonitorConfig& config);
    void ConfigureForbiddenApps(const std::vector<std::string>& forbiddenApps, PlanType planType);
    void ConfigureSuspiciousProcesses(const std::vector<std::string>& processNames,
                                      const std::vector<std::string>& paths,
                                      const std::vector<std::string>& hashes);
    void EnableAdvancedDetection(int windowThreshold = 3, int screenEvasionThreshold = 2);
    void DisableAdvancedDetection();
    MonitorConfig GetConfig() const;

    // Default dispatcher runs publish steps inline on the scan thread; the listener
    // then must not call StopMonitoring.
    void SetDispatcher(Dispatcher dispatcher);
    void SetListener(Listener listener);

    // Returns false when already active
    bool StartMonitoring();
    // Cancels all cycles and clears published state without waiting for an
    // in-flight cycle to finish. No-op when inactive.
    void StopMonitoring();
    bool IsMonitoring() const;

    MonitorSnapshot GetSnapshot() const;

    // Single cycles, also driven by the scheduler
    void RunBasicCycle();
    void RunAdvancedCycle();
    void RunNetworkCycle();

    // Forbidden-app match strings for one process table and GUI registry walk
    static std::vector<std::string> MatchForbiddenApps(const std::vector<std::string>& forbiddenApps,
                                                       const std::vector<ProcessSnapshot>& processes,
                                                       const std::vector<GuiApplication>& apps);

private:
    MonitorDependencies deps_;
    SuspiciousProcessDetector detector_;
    NetworkMonitor networkMonitor_;
    ScanScheduler scheduler_;

    mutable std::mutex configMutex_;
    MonitorConfig config_;
    // Config frozen at start for the running session
    MonitorConfig session_;

    std::mutex controlMutex_;
    std::atomic<bool> active_;
    std::atomic<unsigned long> generation_;

    mutable std::mutex stateMutex_;
    MonitorSnapshot published_;

    // Touched only by the advanced cycle
    AlertState alertState_;

    Dispatcher dispatcher_;
    Listener listener_;
    std::mutex callbackMutex_;
    std::mutex publishMutex_;

    void Publish(unsigned long generation, const std::function<std::vector<MonitorEvent>(MonitorSnapshot&)>& apply);
    void Notify(const std::vector<MonitorEvent>& events);
    void LogLlmActivity() const;
};

#endif // PROCESS_MONITOR_H
