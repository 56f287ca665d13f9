#include "SuspiciousProcessDetector.h"
#include "FileHasher.h"
#include "StringUtils.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

// Substrings that mark a name as worth a full window-server inspection
const char* const kSuspiciousNameKeywords[] = {
    "cluely", "cheat", "hack", "overlay", "inject", "bot", "auto", "trainer", "mod"
};

// Never scanned; exact name match only
const char* const kCoreSystemProcesses[] = {
    "kernel_task", "launchd", "init", "systemd", "kthreadd"
};

// Skipped by the full window-property check (substring match)
const char* const kWindowSystemCritical[] = {
    "kernel_task", "launchd", "WindowServer"
};

const int kElevatedLayerThreshold = 2;

std::string FindSuspiciousKeyword(const std::string& processName) {
    std::string lowerName = ToLower(processName);
    for (const char* keyword : kSuspiciousNameKeywords) {
        if (Contains(lowerName, keyword)) {
            return keyword;
        }
    }
    return std::string();
}

std::string PidSuffix(int pid) {
    return " (PID: " + std::to_string(pid) + ")";
}

AdvancedDetectionResult MakeSuspicious(DetectionType type, const ProcessSnapshot& process,
                                       const std::string& message, const std::vector<std::string>& evidence) {
    AdvancedDetectionResult result;
    result.confidence = DetectionConfidence::Suspicious;
    result.type = type;
    result.processName = process.name;
    result.processPath = process.path;
    result.pid = process.pid;
    result.message = message;
    result.evidence = evidence;
    return result;
}

} // namespace

SuspiciousProcessDetector::SuspiciousProcessDetector(std::shared_ptr<ProcessInspector> processes,
                                                     std::shared_ptr<WindowInspector> windows)
    : processes_(processes), windows_(windows),
      enableAdvancedDetection_(false), windowPropertyThreshold_(3), screenEvasionThreshold_(2) {
}

SuspiciousProcessDetector::~SuspiciousProcessDetector() {
}

void SuspiciousProcessDetector::Configure(const std::vector<std::string>& processNames,
                                          const std::vector<std::string>& paths,
                                          const std::vector<std::string>& hashes) {
    suspiciousProcessNames_.clear();
    suspiciousPaths_.clear();
    suspiciousHashes_.clear();

    for (const auto& name : processNames) {
        // An empty entry would match every process
        if (!name.empty()) suspiciousProcessNames_.insert(ToLower(name));
    }
    for (const auto& path : paths) {
        if (!path.empty()) suspiciousPaths_.insert(path);
    }
    for (const auto& hash : hashes) {
        if (!hash.empty()) suspiciousHashes_.insert(ToLower(hash));
    }

    std::cout << "[SuspiciousProcessDetector] Configured " << suspiciousProcessNames_.size() << " names, "
              << suspiciousPaths_.size() << " paths, " << suspiciousHashes_.size() << " hashes" << std::endl;
}

void SuspiciousProcessDetector::ConfigureAdvancedDetection(bool enabled, int windowThreshold, int screenEvasionThreshold) {
    enableAdvancedDetection_ = enabled;
    windowPropertyThreshold_ = windowThreshold;
    screenEvasionThreshold_ = screenEvasionThreshold;

    std::cout << "[SuspiciousProcessDetector] Advanced detection " << (enabled ? "enabled" : "disabled")
              << " (window threshold " << windowThreshold
              << ", screen evasion threshold " << screenEvasionThreshold << ")" << std::endl;
}

bool SuspiciousProcessDetector::IsAdvancedDetectionEnabled() const {
    return enableAdvancedDetection_;
}

bool SuspiciousProcessDetector::HasSuspiciousName(const std::string& processName) {
    return !FindSuspiciousKeyword(processName).empty();
}

bool SuspiciousProcessDetector::IsCoreSystemProcess(const std::string& processName) {
    for (const char* systemProcess : kCoreSystemProcesses) {
        if (processName == systemProcess) {
            return true;
        }
    }
    return false;
}

int SuspiciousProcessDetector::CalculateProcessScore(const std::string& processName,
                                                     const std::vector<AdvancedDetectionResult>& results) {
    int totalScore = 0;
    for (const auto& result : results) {
        totalScore += static_cast<int>(result.evidence.size()) * 2;
    }
    if (HasSuspiciousName(processName)) {
        totalScore += 5;
    }
    return totalScore;
}

std::vector<ProcessScore> SuspiciousProcessDetector::GetLastScores() const {
    std::lock_guard<std::mutex> lock(scoresMutex_);
    return lastScores_;
}

// Basic scan

BasicScanResult SuspiciousProcessDetector::DetectSuspiciousProcesses(const AlertState& alerted) {
    BasicScanResult scan;

    std::vector<ProcessSnapshot> processes = processes_->ListProcesses();
    for (const auto& process : processes) {
        bool matched = CheckProcessName(process.name, process.pid, scan.results);

        if (!process.path.empty()) {
            matched = CheckProcessPath(process.path, process.name, process.pid, scan.results) || matched;
            matched = CheckProcessHash(process.path, process.name, process.pid, scan.results) || matched;
        }

        if (matched) {
            scan.matchedPids.insert(process.pid);
        }
    }

    std::vector<GuiApplication> apps = processes_->ListGuiApplications();
    for (const auto& app : apps) {
        bool matched = CheckProcessName(app.name, app.pid, scan.results);

        if (!app.bundlePath.empty()) {
            matched = CheckProcessPath(app.bundlePath, app.name, app.pid, scan.results) || matched;
            matched = CheckProcessHash(app.bundlePath, app.name, app.pid, scan.results) || matched;
        }

        if (matched) {
            scan.matchedPids.insert(app.pid);
        }
    }

    for (int pid : scan.matchedPids) {
        if (!alerted.alertedPids.count(pid)) {
            scan.newPids.insert(pid);
        }
    }

    return scan;
}

bool SuspiciousProcessDetector::CheckProcessName(const std::string& processName, int pid,
                                                 std::vector<SuspiciousProcessResult>& out) {
    std::string lowerName = ToLower(processName);

    for (const auto& suspiciousName : suspiciousProcessNames_) {
        if (Contains(lowerName, suspiciousName)) {
            SuspiciousProcessResult result;
            result.type = DetectionType::Name;
            result.processName = processName;
            result.pid = pid;
            result.message = "[NAME] " + processName + PidSuffix(pid);
            out.push_back(result);
            return true;
        }
    }
    return false;
}

bool SuspiciousProcessDetector::CheckProcessPath(const std::string& processPath, const std::string& processName,
                                                 int pid, std::vector<SuspiciousProcessResult>& out) {
    if (!suspiciousPaths_.count(processPath)) {
        return false;
    }

    SuspiciousProcessResult result;
    result.type = DetectionType::Path;
    result.processName = processName;
    result.processPath = processPath;
    result.pid = pid;
    result.message = "[PATH] " + processPath + PidSuffix(pid);
    out.push_back(result);
    return true;
}

bool SuspiciousProcessDetector::CheckProcessHash(const std::string& processPath, const std::string& processName,
                                                 int pid, std::vector<SuspiciousProcessResult>& out) {
    std::string fileHash;
    if (!MatchesHash(processPath, fileHash)) {
        return false;
    }

    SuspiciousProcessResult result;
    result.type = DetectionType::Hash;
    result.processName = processName;
    result.processPath = processPath;
    result.pid = pid;
    result.message = "[HASH] " + processPath + PidSuffix(pid);
    out.push_back(result);
    return true;
}

bool SuspiciousProcessDetector::MatchesHash(const std::string& processPath, std::string& fileHash) const {
    if (suspiciousHashes_.empty() || processPath.empty()) {
        return false;
    }

    // Unreadable binaries simply do not match
    if (FileHasher::Sha256(processPath, fileHash) != HashStatus::Ok) {
        return false;
    }
    return suspiciousHashes_.count(fileHash) > 0;
}

// Advanced scan

std::vector<AdvancedDetectionResult> SuspiciousProcessDetector::DetectAdvancedSuspiciousProcesses() {
    std::vector<AdvancedDetectionResult> results;
    if (!enableAdvancedDetection_) {
        return results;
    }

    auto startTime = std::chrono::steady_clock::now();
    std::vector<ProcessScore> scores;

    std::vector<ProcessSnapshot> processes = processes_->ListProcesses();
    for (const auto& process : processes) {
        size_t beforeCount = results.size();
        AnalyzeProcess(process, results);

        if (results.size() > beforeCount) {
            std::vector<AdvancedDetectionResult> processResults(results.begin() + beforeCount, results.end());
            scores.emplace_back(process.name, process.pid, CalculateProcessScore(process.name, processResults));
        }
    }

    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(2)
            << std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    std::cout << "[SuspiciousProcessDetector] Advanced detection scan completed in "
              << elapsed.str() << "s - Found " << results.size() << " detections" << std::endl;

    std::stable_sort(scores.begin(), scores.end(), [](const ProcessScore& a, const ProcessScore& b) {
        return a.score > b.score;
    });
    LogTopScores(scores);

    {
        std::lock_guard<std::mutex> lock(scoresMutex_);
        lastScores_ = scores;
    }

    return results;
}

void SuspiciousProcessDetector::AnalyzeProcess(const ProcessSnapshot& process,
                                               std::vector<AdvancedDetectionResult>& results) {
    if (IsCoreSystemProcess(process.name)) {
        return;
    }

    bool windowsAvailable = windows_ && windows_->IsAvailable();

    // Cheap name test decides whether the compositor is queried at all
    if (HasSuspiciousName(process.name)) {
        CheckProcessNameAdvanced(process.name, process.pid, results);
        if (!process.path.empty()) {
            CheckProcessPathAdvanced(process.path, process.name, process.pid, results);
            CheckProcessHashAdvanced(process.path, process.name, process.pid, results);
        }

        if (windowsAvailable) {
            CheckWindowProperties(process, results);
            CheckScreenEvasion(process, results);
            CheckElevatedLayers(process, results);
        }
    } else {
        CheckProcessNameAdvanced(process.name, process.pid, results);
        if (!process.path.empty()) {
            CheckProcessPathAdvanced(process.path, process.name, process.pid, results);
        }

        if (windowsAvailable) {
            CheckWindowPropertiesLightweight(process, results);
        }
    }
}

bool SuspiciousProcessDetector::CheckProcessNameAdvanced(const std::string& processName, int pid,
                                                         std::vector<AdvancedDetectionResult>& results) {
    std::string lowerName = ToLower(processName);

    for (const auto& suspiciousName : suspiciousProcessNames_) {
        if (Contains(lowerName, suspiciousName)) {
            AdvancedDetectionResult result;
            result.confidence = DetectionConfidence::Definitive;
            result.type = DetectionType::Name;
            result.processName = processName;
            result.pid = pid;
            result.message = "[DEFINITIVE] Process name match: " + processName + PidSuffix(pid);
            result.evidence.push_back("Process name contains '" + suspiciousName + "'");
            results.push_back(result);
            return true;
        }
    }
    return false;
}

bool SuspiciousProcessDetector::CheckProcessPathAdvanced(const std::string& processPath, const std::string& processName,
                                                         int pid, std::vector<AdvancedDetectionResult>& results) {
    if (!suspiciousPaths_.count(processPath)) {
        return false;
    }

    AdvancedDetectionResult result;
    result.confidence = DetectionConfidence::Definitive;
    result.type = DetectionType::Path;
    result.processName = processName;
    result.processPath = processPath;
    result.pid = pid;
    result.message = "[DEFINITIVE] Path match: " + processPath + PidSuffix(pid);
    result.evidence.push_back("Process path exactly matches known suspicious path");
    results.push_back(result);
    return true;
}

bool SuspiciousProcessDetector::CheckProcessHashAdvanced(const std::string& processPath, const std::string& processName,
                                                         int pid, std::vector<AdvancedDetectionResult>& results) {
    std::string fileHash;
    if (!MatchesHash(processPath, fileHash)) {
        return false;
    }

    AdvancedDetectionResult result;
    result.confidence = DetectionConfidence::Definitive;
    result.type = DetectionType::Hash;
    result.processName = processName;
    result.processPath = processPath;
    result.pid = pid;
    result.message = "[DEFINITIVE] Hash match: " + processPath + PidSuffix(pid);
    result.evidence.push_back("File hash matches known suspicious binary: " + fileHash);
    results.push_back(result);
    return true;
}

void SuspiciousProcessDetector::CheckWindowProperties(const ProcessSnapshot& process,
                                                      std::vector<AdvancedDetectionResult>& results) {
    for (const char* critical : kWindowSystemCritical) {
        if (Contains(process.name, critical)) {
            return;
        }
    }

    WindowProperties properties;
    try {
        properties = windows_->GetWindowProperties(process.pid);
    } catch (const std::exception& e) {
        std::cerr << "[SuspiciousProcessDetector] Window properties unavailable for PID "
                  << process.pid << ": " << e.what() << std::endl;
        return;
    }

    std::vector<std::string> evidence;
    int score = 0;

    // Stealth: invisible or a single capture-excluded window
    if (properties.windowCount == 0) {
        evidence.push_back("Completely hidden - no visible windows");
        score += 3;
    }
    if (properties.windowCount == 1 && properties.sharingStateDisabled > 0) {
        evidence.push_back("Single hidden window detected");
        score += 2;
    }

    if (properties.windowCount <= 3 && properties.sharingStateDisabled > 0 && properties.elevatedLayers > 0) {
        evidence.push_back("Classic evasion pattern: few windows with hiding techniques");
        score += 4;
    }

    std::string keyword = FindSuspiciousKeyword(process.name);
    if (!keyword.empty()) {
        evidence.push_back("Suspicious process name contains '" + keyword + "'");
        score += 5;
    }

    double evasionRatio = static_cast<double>(properties.sharingStateDisabled) /
                          static_cast<double>(std::max(properties.windowCount, 1));
    if (evasionRatio >= 0.5 && properties.windowCount <= 5) {
        std::ostringstream ratio;
        ratio << std::fixed << std::setprecision(1) << evasionRatio;
        evidence.push_back("High evasion ratio: " + ratio.str() + " with low window count");
        score += 3;
    }

    if (properties.windowCount <= 2 && properties.elevatedLayers > 0) {
        evidence.push_back("Minimal windows but using elevated layers");
        score += 2;
    }

    if (properties.windowCount > 20) {
        evidence.push_back("Excessive window count: " + std::to_string(properties.windowCount) +
                           " - possibly automation/scripting");
        score += 1;
    }

    if (score >= windowPropertyThreshold_ && !evidence.empty()) {
        results.push_back(MakeSuspicious(
            DetectionType::WindowProperty, process,
            "[SUSPICIOUS] Stealth behavior detected: " + process.name + PidSuffix(process.pid),
            evidence));
    }
}

void SuspiciousProcessDetector::CheckWindowPropertiesLightweight(const ProcessSnapshot& process,
                                                                 std::vector<AdvancedDetectionResult>& results) {
    std::vector<std::string> evidence;
    int score = 0;

    // Counters precomputed during enumeration, no extra compositor queries.
    // A windowless benign process is only hidden when another counter fired.
    bool otherSignal = process.suspiciousWindowCount > 0 || process.screenEvasionCount > 0 ||
                       process.elevatedLayerCount > 0;
    if (process.windowCount == 0 && otherSignal) {
        evidence.push_back("Completely hidden - no visible windows");
        score += 3;
    }
    if (process.suspiciousWindowCount > 0) {
        evidence.push_back("Suspicious window patterns detected");
        score += 2;
    }
    if (process.screenEvasionCount > 0) {
        evidence.push_back("Screen evasion detected");
        score += 1;
    }
    if (process.elevatedLayerCount > 0) {
        evidence.push_back("Elevated layer usage");
        score += 1;
    }

    if (score >= windowPropertyThreshold_ && !evidence.empty()) {
        results.push_back(MakeSuspicious(
            DetectionType::WindowProperty, process,
            "[SUSPICIOUS] Lightweight stealth detection: " + process.name + PidSuffix(process.pid),
            evidence));
    }
}

void SuspiciousProcessDetector::CheckScreenEvasion(const ProcessSnapshot& process,
                                                   std::vector<AdvancedDetectionResult>& results) {
    int evasionCount = 0;
    try {
        evasionCount = windows_->DetectScreenEvasion(process.pid);
    } catch (const std::exception& e) {
        std::cerr << "[SuspiciousProcessDetector] Screen evasion query failed for PID "
                  << process.pid << ": " << e.what() << std::endl;
        return;
    }

    if (evasionCount == 0) {
        return;
    }

    std::vector<std::string> evidence;
    int score = 0;

    // AnalyzeProcess only runs this check for suspicious names, so the benign
    // branches below are currently unreachable
    if (HasSuspiciousName(process.name)) {
        score += 5;
        evidence.push_back("Suspicious process name with screen evasion: " + std::to_string(evasionCount));
    } else if (evasionCount >= 15) {
        score += 3;
        evidence.push_back("Excessive screen evasion techniques: " + std::to_string(evasionCount));
    } else if (evasionCount >= 5 && !Contains(process.path, "/Applications/")) {
        score += 2;
        evidence.push_back("Screen evasion from non-standard location: " + std::to_string(evasionCount));
    }

    if (score >= screenEvasionThreshold_ && !evidence.empty()) {
        evidence.push_back("Process path: " + process.path);
        results.push_back(MakeSuspicious(
            DetectionType::ScreenEvasion, process,
            "[SUSPICIOUS] Screen evasion detected: " + process.name + PidSuffix(process.pid),
            evidence));
    }
}

void SuspiciousProcessDetector::CheckElevatedLayers(const ProcessSnapshot& process,
                                                    std::vector<AdvancedDetectionResult>& results) {
    int elevatedCount = 0;
    try {
        elevatedCount = windows_->DetectElevatedLayers(process.pid);
    } catch (const std::exception& e) {
        std::cerr << "[SuspiciousProcessDetector] Elevated layer query failed for PID "
                  << process.pid << ": " << e.what() << std::endl;
        return;
    }

    if (elevatedCount == 0) {
        return;
    }

    std::vector<std::string> evidence;
    int score = 0;

    // Benign branches unreachable for the same reason as in CheckScreenEvasion
    if (HasSuspiciousName(process.name)) {
        score += 4;
        evidence.push_back("Suspicious process using elevated layers: " + std::to_string(elevatedCount));
    } else if (elevatedCount >= 10) {
        score += 2;
        evidence.push_back("Excessive elevated layer usage: " + std::to_string(elevatedCount));
    } else if (elevatedCount >= 3 && !Contains(process.path, "/Applications/") &&
               !Contains(process.path, "/System/")) {
        score += 2;
        evidence.push_back("Elevated layers from non-standard location: " + std::to_string(elevatedCount));
    }

    if (score >= kElevatedLayerThreshold && !evidence.empty()) {
        evidence.push_back("Process path: " + process.path);
        results.push_back(MakeSuspicious(
            DetectionType::ElevatedLayer, process,
            "[SUSPICIOUS] Elevated layer usage: " + process.name + PidSuffix(process.pid),
            evidence));
    }
}

void SuspiciousProcessDetector::LogTopScores(const std::vector<ProcessScore>& scores) const {
    if (scores.empty()) {
        return;
    }

    std::cout << "[SuspiciousProcessDetector] Top suspicion scores:" << std::endl;
    size_t shown = std::min<size_t>(scores.size(), 10);
    for (size_t i = 0; i < shown; i++) {
        std::cout << "[SuspiciousProcessDetector] " << (i + 1) << ". " << scores[i].processName
                  << " (PID: " << scores[i].pid << ") - Score: " << scores[i].score << std::endl;
    }
}
