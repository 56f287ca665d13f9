#ifndef SUSPICIOUS_PROCESS_DETECTOR_H
#define SUSPICIOUS_PROCESS_DETECTOR_H

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "CommonTypes.h"
#include "ProcessBridge.h"

// Pids already reported by the basic scan. Owned by the orchestrator and
// handed to each scan; never mutated inside a scan.
struct AlertState {
    std::set<int> alertedPids;
};

struct BasicScanResult {
    std::vector<SuspiciousProcessResult> results;
    std::set<int> matchedPids;   // every pid matched this scan
    std::set<int> newPids;       // matched this scan but absent from the AlertState
};

struct ProcessScore {
    std::string processName;
    int pid;
    int score;

    ProcessScore(const std::string& n, int p, int s) : processName(n), pid(p), score(s) {}
};

class SuspiciousProcessDetector {
public:
    SuspiciousProcessDetector(std::shared_ptr<ProcessInspector> processes,
                              std::shared_ptr<WindowInspector> windows);
    ~SuspiciousProcessDetector();

    // Names and hashes match case-insensitively, paths exactly
    void Configure(const std::vector<std::string>& processNames,
                   const std::vector<std::string>& paths,
                   const std::vector<std::string>& hashes);
    void ConfigureAdvancedDetection(bool enabled, int windowThreshold = 3, int screenEvasionThreshold = 2);
    bool IsAdvancedDetectionEnabled() const;

    // Deny-list matching over the process table and the GUI application registry.
    // Throws BridgeException when the process table is unavailable.
    BasicScanResult DetectSuspiciousProcesses(const AlertState& alerted);

    // Heuristic scan; empty unless advanced detection is enabled.
    // Throws BridgeException when the process table is unavailable.
    std::vector<AdvancedDetectionResult> DetectAdvancedSuspiciousProcesses();

    // Per-process advanced analysis, appends to results
    void AnalyzeProcess(const ProcessSnapshot& process, std::vector<AdvancedDetectionResult>& results);

    std::vector<ProcessScore> GetLastScores() const;

    static bool HasSuspiciousName(const std::string& processName);
    static bool IsCoreSystemProcess(const std::string& processName);
    static int CalculateProcessScore(const std::string& processName,
                                     const std::vector<AdvancedDetectionResult>& results);

private:
    std::shared_ptr<ProcessInspector> processes_;
    std::shared_ptr<WindowInspector> windows_;

    std::set<std::string> suspiciousProcessNames_;
    std::set<std::string> suspiciousPaths_;
    std::set<std::string> suspiciousHashes_;

    bool enableAdvancedDetection_;
    int windowPropertyThreshold_;
    int screenEvasionThreshold_;

    mutable std::mutex scoresMutex_;
    std::vector<ProcessScore> lastScores_;

    // Basic tier
    bool CheckProcessName(const std::string& processName, int pid, std::vector<SuspiciousProcessResult>& out);
    bool CheckProcessPath(const std::string& processPath, const std::string& processName, int pid,
                          std::vector<SuspiciousProcessResult>& out);
    bool CheckProcessHash(const std::string& processPath, const std::string& processName, int pid,
                          std::vector<SuspiciousProcessResult>& out);

    // Advanced tier, definitive
    bool CheckProcessNameAdvanced(const std::string& processName, int pid,
                                  std::vector<AdvancedDetectionResult>& results);
    bool CheckProcessPathAdvanced(const std::string& processPath, const std::string& processName, int pid,
                                  std::vector<AdvancedDetectionResult>& results);
    bool CheckProcessHashAdvanced(const std::string& processPath, const std::string& processName, int pid,
                                  std::vector<AdvancedDetectionResult>& results);

    // Advanced tier, heuristic
    void CheckWindowProperties(const ProcessSnapshot& process, std::vector<AdvancedDetectionResult>& results);
    void CheckWindowPropertiesLightweight(const ProcessSnapshot& process, std::vector<AdvancedDetectionResult>& results);
    void CheckScreenEvasion(const ProcessSnapshot& process, std::vector<AdvancedDetectionResult>& results);
    void CheckElevatedLayers(const ProcessSnapshot& process, std::vector<AdvancedDetectionResult>& results);

    bool MatchesHash(const std::string& processPath, std::string& fileHash) const;
    void LogTopScores(const std::vector<ProcessScore>& scores) const;
};

#endif // SUSPICIOUS_PROCESS_DETECTOR_H
