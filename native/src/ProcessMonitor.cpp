#include "ProcessMonitor.h"
#include "StringUtils.h"

#include <chrono>
#include <iostream>
#include <set>

const char* ToString(MonitorEvent event) {
    switch (event) {
        case MonitorEvent::ForbiddenApps: return "forbidden-apps";
        case MonitorEvent::SuspiciousProcesses: return "suspicious-processes";
        case MonitorEvent::AdvancedDetections: return "advanced-detections";
        case MonitorEvent::NetworkDetections: return "network-detections";
    }
    return "unknown";
}

MonitorDependencies CreateSystemDependencies(int utilityTimeoutMs, int dnsTimeoutMs) {
    MonitorDependencies deps;
    deps.windows = CreateSystemWindowInspector();
    deps.processes = CreateSystemProcessInspector(deps.windows);
    deps.connections = std::make_shared<LsofConnectionSource>(utilityTimeoutMs);
    deps.resolver = std::make_shared<ReverseDnsResolver>(dnsTimeoutMs);
    return deps;
}

ProcessMonitor::ProcessMonitor(const MonitorDependencies& deps)
    : deps_(deps),
      detector_(deps.processes, deps.windows),
      networkMonitor_(deps.connections, deps.resolver, deps.processes),
      active_(false), generation_(0) {
}

ProcessMonitor::~ProcessMonitor() {
    StopMonitoring();
    // Cycles still finishing touch members declared after the scheduler
    scheduler_.WaitForRetired();
}

void ProcessMonitor::Configure(const MonitorConfig& config) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;
    config_.Normalize();
    std::cout << "[ProcessMonitor] Configured for " << ToString(config_.planType) << " plan" << std::endl;
}

void ProcessMonitor::ConfigureForbiddenApps(const std::vector<std::string>& forbiddenApps, PlanType planType) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.forbiddenApps = forbiddenApps;
    config_.planType = planType;
    config_.Normalize();
    std::cout << "[ProcessMonitor] Configured for " << ToString(planType) << " plan with "
              << config_.forbiddenApps.size() << " forbidden apps" << std::endl;
}

void ProcessMonitor::ConfigureSuspiciousProcesses(const std::vector<std::string>& processNames,
                                                  const std::vector<std::string>& paths,
                                                  const std::vector<std::string>& hashes) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.suspiciousNames = processNames;
    config_.suspiciousPaths = paths;
    config_.suspiciousHashes = hashes;
    config_.Normalize();
}

void ProcessMonitor::EnableAdvancedDetection(int windowThreshold, int screenEvasionThreshold) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.enableAdvancedDetection = true;
    config_.windowThreshold = windowThreshold;
    config_.screenEvasionThreshold = screenEvasionThreshold;
}

void ProcessMonitor::DisableAdvancedDetection() {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.enableAdvancedDetection = false;
}

MonitorConfig ProcessMonitor::GetConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void ProcessMonitor::SetDispatcher(Dispatcher dispatcher) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    dispatcher_ = dispatcher;
}

void ProcessMonitor::SetListener(Listener listener) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    listener_ = listener;
}

bool ProcessMonitor::StartMonitoring() {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (active_) {
        return false;
    }

    // Cycles of the previous session may still be running against the detector
    scheduler_.WaitForRetired();

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        session_ = config_;
    }

    detector_.Configure(session_.suspiciousNames, session_.suspiciousPaths, session_.suspiciousHashes);
    detector_.ConfigureAdvancedDetection(session_.enableAdvancedDetection, session_.windowThreshold,
                                         session_.screenEvasionThreshold);
    alertState_ = AlertState();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        published_ = MonitorSnapshot();
        generation_++;
        active_ = true;
    }

    scheduler_.Schedule("basic", session_.basicIntervalMs, [this]() { RunBasicCycle(); });

    // Plan tier is decided once per session
    if (session_.planType == PlanType::Pro) {
        scheduler_.Schedule("advanced", session_.advancedIntervalMs, [this]() { RunAdvancedCycle(); });
        scheduler_.Schedule("network", session_.networkIntervalMs, [this]() { RunNetworkCycle(); });
        std::cout << "[ProcessMonitor] Pro plan: advanced detection and network monitoring enabled" << std::endl;
    } else {
        std::cout << "[ProcessMonitor] Free plan: basic process monitoring only" << std::endl;
    }

    std::cout << "[ProcessMonitor] Started" << std::endl;
    return true;
}

void ProcessMonitor::StopMonitoring() {
    std::lock_guard<std::mutex> control(controlMutex_);
    if (!active_) {
        return;
    }

    {
        std::lock_guard<std::mutex> publish(publishMutex_);
        std::lock_guard<std::mutex> lock(stateMutex_);
        active_ = false;
        generation_++;
    }

    // Returns without waiting for in-flight cycles; their publishes are dropped
    scheduler_.CancelAll();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        published_ = MonitorSnapshot();
    }

    std::cout << "[ProcessMonitor] Stopped" << std::endl;
}

bool ProcessMonitor::IsMonitoring() const {
    return active_.load();
}

MonitorSnapshot ProcessMonitor::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return published_;
}

std::vector<std::string> ProcessMonitor::MatchForbiddenApps(const std::vector<std::string>& forbiddenApps,
                                                            const std::vector<ProcessSnapshot>& processes,
                                                            const std::vector<GuiApplication>& apps) {
    std::vector<std::string> detected;
    std::set<std::string> seen;

    auto add = [&detected, &seen](const std::string& entry) {
        if (seen.insert(entry).second) {
            detected.push_back(entry);
        }
    };

    for (const auto& process : processes) {
        std::string lowerName = ToLower(process.name);
        std::string lowerPath = ToLower(process.path);

        for (const auto& forbidden : forbiddenApps) {
            std::string forbiddenLower = ToLower(forbidden);

            if (Contains(lowerName, forbiddenLower)) {
                add(process.name + " (PID: " + std::to_string(process.pid) + ")");
            } else if (!lowerPath.empty() && Contains(lowerPath, forbiddenLower)) {
                add(process.name + " (Path: " + process.path + ")");
            } else if (Contains(lowerPath, "/" + forbiddenLower + ".app/")) {
                add(process.name + " (App: " + forbidden + ")");
            }
        }
    }

    for (const auto& app : apps) {
        if (app.name.empty()) {
            continue;
        }
        std::string lowerName = ToLower(app.name);
        std::string lowerBundleId = ToLower(app.bundleId);

        for (const auto& forbidden : forbiddenApps) {
            std::string forbiddenLower = ToLower(forbidden);

            if (Contains(lowerName, forbiddenLower)) {
                add(app.name + " (GUI App - PID: " + std::to_string(app.pid) + ")");
            }
            if (!lowerBundleId.empty() && Contains(lowerBundleId, forbiddenLower)) {
                add(app.name + " (Bundle: " + app.bundleId + ")");
            }
        }
    }

    return detected;
}

void ProcessMonitor::RunBasicCycle() {
    if (!active_) {
        return;
    }
    unsigned long generation = generation_.load();

    std::vector<ProcessSnapshot> processes;
    std::vector<GuiApplication> apps;
    try {
        processes = deps_.processes->ListProcesses();
        apps = deps_.processes->ListGuiApplications();
    } catch (const BridgeException& e) {
        std::cerr << "[ProcessMonitor] Process table unavailable (" << ToString(e.status()) << "): "
                  << e.what() << std::endl;
        return;
    }

    std::vector<std::string> detected = MatchForbiddenApps(session_.forbiddenApps, processes, apps);
    if (!detected.empty()) {
        std::cout << "[ProcessMonitor] Forbidden apps detected:";
        for (const auto& entry : detected) {
            std::cout << " [" << entry << "]";
        }
        std::cout << std::endl;
    }

    LogLlmActivity();

    Publish(generation, [detected](MonitorSnapshot& snapshot) {
        std::vector<MonitorEvent> events;
        if (snapshot.forbiddenApps != detected) {
            snapshot.forbiddenApps = detected;
            events.push_back(MonitorEvent::ForbiddenApps);
        }
        return events;
    });
}

void ProcessMonitor::RunAdvancedCycle() {
    if (!active_) {
        return;
    }
    unsigned long generation = generation_.load();

    BasicScanResult basic;
    std::vector<AdvancedDetectionResult> advanced;
    try {
        basic = detector_.DetectSuspiciousProcesses(alertState_);
        advanced = detector_.DetectAdvancedSuspiciousProcesses();
    } catch (const BridgeException& e) {
        std::cerr << "[ProcessMonitor] Suspicious process scan skipped (" << ToString(e.status()) << "): "
                  << e.what() << std::endl;
        return;
    }

    for (const auto& result : basic.results) {
        if (basic.newPids.count(result.pid)) {
            std::cout << "[ProcessMonitor] New suspicious process: " << result.message << std::endl;
        }
    }
    alertState_.alertedPids = basic.matchedPids;

    std::vector<SuspiciousProcessResult> suspicious = basic.results;
    Publish(generation, [suspicious, advanced](MonitorSnapshot& snapshot) {
        std::vector<MonitorEvent> events;
        if (snapshot.suspiciousProcesses != suspicious) {
            snapshot.suspiciousProcesses = suspicious;
            events.push_back(MonitorEvent::SuspiciousProcesses);
        }
        if (snapshot.advancedDetections != advanced) {
            snapshot.advancedDetections = advanced;
            events.push_back(MonitorEvent::AdvancedDetections);
        }
        return events;
    });
}

void ProcessMonitor::RunNetworkCycle() {
    if (!active_) {
        return;
    }
    unsigned long generation = generation_.load();

    auto startTime = std::chrono::steady_clock::now();
    std::vector<NetworkDetectionResult> fresh;
    if (!networkMonitor_.CheckNetworkConnections(fresh)) {
        return;
    }
    double scanSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

    auto now = std::chrono::system_clock::now();
    NetworkMonitor* networkMonitor = &networkMonitor_;
    Publish(generation, [networkMonitor, fresh, now, scanSeconds](MonitorSnapshot& snapshot) {
        snapshot.networkDetections = NetworkMonitor::MergeDetections(snapshot.networkDetections, fresh, now);
        networkMonitor->MaybeLogSummary(scanSeconds, fresh, snapshot.networkDetections.size());
        return std::vector<MonitorEvent>(1, MonitorEvent::NetworkDetections);
    });
}

void ProcessMonitor::Publish(unsigned long generation,
                             const std::function<std::vector<MonitorEvent>(MonitorSnapshot&)>& apply) {
    // Held across dispatch so nothing is handed to the dispatcher once stop has returned
    std::lock_guard<std::mutex> publish(publishMutex_);
    if (!active_ || generation != generation_) {
        return;
    }

    Dispatcher dispatcher;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        dispatcher = dispatcher_;
    }

    std::function<std::vector<MonitorEvent>(MonitorSnapshot&)> step = apply;
    std::function<void()> publishStep = [this, generation, step]() {
        std::vector<MonitorEvent> events;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            // Late publishes from a stopped or previous session are dropped
            if (!active_ || generation != generation_) {
                return;
            }
            events = step(published_);
        }
        Notify(events);
    };

    if (dispatcher) {
        dispatcher(publishStep);
    } else {
        publishStep();
    }
}

void ProcessMonitor::Notify(const std::vector<MonitorEvent>& events) {
    if (events.empty()) {
        return;
    }

    Listener listener;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        listener = listener_;
    }
    if (!listener) {
        return;
    }

    MonitorSnapshot snapshot = GetSnapshot();
    for (MonitorEvent event : events) {
        listener(event, snapshot);
    }
}

void ProcessMonitor::LogLlmActivity() const {
    std::vector<NetworkDetectionResult> detections;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        detections = published_.networkDetections;
    }

    std::vector<std::string> lines = NetworkMonitor::DescribeLlmActivity(detections);
    for (const auto& line : lines) {
        std::cout << "[ProcessMonitor] " << line << std::endl;
    }
}
