#include "DetectionJson.h"
#include "StringUtils.h"

#include <sstream>

namespace {

void WriteStringArray(std::ostringstream& json, const std::vector<std::string>& values) {
    json << "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) json << ",";
        json << "\"" << EscapeJson(values[i]) << "\"";
    }
    json << "]";
}

template <typename T>
size_t WriteItems(std::ostringstream& json, const std::vector<T>& items) {
    json << "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) json << ",";
        json << ToJson(items[i]);
    }
    json << "]";
    return items.size();
}

} // namespace

int64_t ToEpochMillis(std::chrono::system_clock::time_point timestamp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
}

std::string ToJson(const SuspiciousProcessResult& result) {
    std::ostringstream json;
    json << "{"
         << "\"type\":\"" << ToString(result.type) << "\","
         << "\"processName\":\"" << EscapeJson(result.processName) << "\","
         << "\"processPath\":\"" << EscapeJson(result.processPath) << "\","
         << "\"pid\":" << result.pid << ","
         << "\"message\":\"" << EscapeJson(result.message) << "\""
         << "}";
    return json.str();
}

std::string ToJson(const AdvancedDetectionResult& result) {
    std::ostringstream json;
    json << "{"
         << "\"confidence\":\"" << ToString(result.confidence) << "\","
         << "\"type\":\"" << ToString(result.type) << "\","
         << "\"processName\":\"" << EscapeJson(result.processName) << "\","
         << "\"processPath\":\"" << EscapeJson(result.processPath) << "\","
         << "\"pid\":" << result.pid << ","
         << "\"message\":\"" << EscapeJson(result.message) << "\","
         << "\"evidence\":";
    WriteStringArray(json, result.evidence);
    json << "}";
    return json.str();
}

std::string ToJson(const NetworkDetectionResult& result) {
    std::ostringstream json;
    json << "{"
         << "\"timestamp\":" << ToEpochMillis(result.timestamp) << ","
         << "\"processName\":\"" << EscapeJson(result.processName) << "\","
         << "\"processPath\":\"" << EscapeJson(result.processPath) << "\","
         << "\"pid\":" << result.pid << ","
         << "\"destinationDomain\":\"" << EscapeJson(result.destinationDomain) << "\","
         << "\"destinationPort\":" << result.destinationPort << ","
         << "\"protocol\":\"" << EscapeJson(result.connectionProtocol) << "\","
         << "\"confidence\":\"" << ToString(result.confidence) << "\","
         << "\"message\":\"" << EscapeJson(result.message) << "\","
         << "\"evidence\":";
    WriteStringArray(json, result.evidence);
    json << "}";
    return json.str();
}

std::string CreateEventJson(MonitorEvent event, const MonitorSnapshot& snapshot, int64_t timestampMs) {
    std::ostringstream items;
    size_t count = 0;

    switch (event) {
        case MonitorEvent::ForbiddenApps:
            WriteStringArray(items, snapshot.forbiddenApps);
            count = snapshot.forbiddenApps.size();
            break;
        case MonitorEvent::SuspiciousProcesses:
            count = WriteItems(items, snapshot.suspiciousProcesses);
            break;
        case MonitorEvent::AdvancedDetections:
            count = WriteItems(items, snapshot.advancedDetections);
            break;
        case MonitorEvent::NetworkDetections:
            count = WriteItems(items, snapshot.networkDetections);
            break;
    }

    std::ostringstream json;
    json << "{"
         << "\"module\":\"vigil\","
         << "\"event\":\"" << ToString(event) << "\","
         << "\"ts\":" << timestampMs << ","
         << "\"count\":" << count << ","
         << "\"items\":" << items.str() << ","
         << "\"source\":\"native\""
         << "}";
    return json.str();
}
