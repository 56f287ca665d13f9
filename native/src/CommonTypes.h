#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <string>
#include <vector>
#include <chrono>

// Status codes returned by the native process/window bridge
enum class BridgeStatus {
    Success = 0,
    NullPointer = -1,
    InvalidParameter = -2,
    MemoryAllocation = -3,
    SystemCall = -4,
    FileAccess = -5
};

enum class PlanType {
    Free = 0,
    Pro = 1
};

enum class DetectionConfidence {
    Definitive,    // exact name/path/hash match
    Suspicious,    // heuristic signal
    Clean
};

enum class DetectionType {
    Name,
    Path,
    Hash,
    WindowProperty,
    ScreenEvasion,
    ElevatedLayer,
    BehavioralPattern
};

enum class NetworkConfidence {
    Definitive,    // known LLM API endpoint
    Suspicious,    // AI/ML related domain or keyword
    Informational
};

// One row of the OS process table, rebuilt every scan cycle
struct ProcessSnapshot {
    int pid;
    std::string name;
    std::string path;
    int windowCount;
    int suspiciousWindowCount;
    int screenEvasionCount;
    int elevatedLayerCount;

    ProcessSnapshot() : pid(0), windowCount(0), suspiciousWindowCount(0),
                        screenEvasionCount(0), elevatedLayerCount(0) {}

    ProcessSnapshot(int p, const std::string& n, const std::string& pt = "")
        : pid(p), name(n), path(pt), windowCount(0), suspiciousWindowCount(0),
          screenEvasionCount(0), elevatedLayerCount(0) {}
};

// Entry of the OS registry of running GUI applications
struct GuiApplication {
    int pid;
    std::string name;
    std::string bundlePath;
    std::string bundleId;

    GuiApplication() : pid(0) {}

    GuiApplication(int p, const std::string& n, const std::string& bp = "", const std::string& id = "")
        : pid(p), name(n), bundlePath(bp), bundleId(id) {}
};

struct WindowProperties {
    int windowCount;
    int sharingStateDisabled;
    int elevatedLayers;
    int suspiciousPatterns;

    WindowProperties() : windowCount(0), sharingStateDisabled(0), elevatedLayers(0), suspiciousPatterns(0) {}
};

struct SuspiciousProcessResult {
    DetectionType type;    // Name, Path or Hash only
    std::string processName;
    std::string processPath;
    int pid;
    std::string message;

    SuspiciousProcessResult() : type(DetectionType::Name), pid(0) {}

    bool operator==(const SuspiciousProcessResult& other) const {
        return type == other.type && processName == other.processName &&
               processPath == other.processPath && pid == other.pid && message == other.message;
    }
    bool operator!=(const SuspiciousProcessResult& other) const { return !(*this == other); }
};

struct AdvancedDetectionResult {
    DetectionConfidence confidence;
    DetectionType type;
    std::string processName;
    std::string processPath;
    int pid;
    std::string message;
    std::vector<std::string> evidence;

    AdvancedDetectionResult() : confidence(DetectionConfidence::Clean), type(DetectionType::Name), pid(0) {}

    bool operator==(const AdvancedDetectionResult& other) const {
        return confidence == other.confidence && type == other.type &&
               processName == other.processName && processPath == other.processPath &&
               pid == other.pid && message == other.message && evidence == other.evidence;
    }
    bool operator!=(const AdvancedDetectionResult& other) const { return !(*this == other); }
};

struct NetworkDetectionResult {
    std::chrono::system_clock::time_point timestamp;
    std::string processName;
    std::string processPath;
    int pid;
    std::string destinationDomain;
    int destinationPort;
    std::string connectionProtocol;
    NetworkConfidence confidence;
    std::string message;
    std::vector<std::string> evidence;

    NetworkDetectionResult() : pid(0), destinationPort(0), confidence(NetworkConfidence::Informational) {}
};

inline const char* ToString(DetectionConfidence confidence) {
    switch (confidence) {
        case DetectionConfidence::Definitive: return "DEFINITIVE";
        case DetectionConfidence::Suspicious: return "SUSPICIOUS";
        case DetectionConfidence::Clean: return "CLEAN";
    }
    return "CLEAN";
}

inline const char* ToString(NetworkConfidence confidence) {
    switch (confidence) {
        case NetworkConfidence::Definitive: return "DEFINITIVE";
        case NetworkConfidence::Suspicious: return "SUSPICIOUS";
        case NetworkConfidence::Informational: return "INFO";
    }
    return "INFO";
}

inline const char* ToString(DetectionType type) {
    switch (type) {
        case DetectionType::Name: return "name";
        case DetectionType::Path: return "path";
        case DetectionType::Hash: return "hash";
        case DetectionType::WindowProperty: return "window_property";
        case DetectionType::ScreenEvasion: return "screen_evasion";
        case DetectionType::ElevatedLayer: return "elevated_layer";
        case DetectionType::BehavioralPattern: return "behavioral_pattern";
    }
    return "name";
}

inline const char* ToString(PlanType plan) {
    return plan == PlanType::Pro ? "Pro" : "Free";
}

inline const char* ToString(BridgeStatus status) {
    switch (status) {
        case BridgeStatus::Success: return "success";
        case BridgeStatus::NullPointer: return "null pointer";
        case BridgeStatus::InvalidParameter: return "invalid parameter";
        case BridgeStatus::MemoryAllocation: return "memory allocation failure";
        case BridgeStatus::SystemCall: return "system call failure";
        case BridgeStatus::FileAccess: return "file access failure";
    }
    return "unknown";
}

#endif // COMMON_TYPES_H
