#ifndef DETECTION_JSON_H
#define DETECTION_JSON_H

#include <chrono>
#include <cstdint>
#include <string>

#include "ProcessMonitor.h"

std::string ToJson(const SuspiciousProcessResult& result);
std::string ToJson(const AdvancedDetectionResult& result);
std::string ToJson(const NetworkDetectionResult& result);

// Callback payload for one published change:
// {"module":"vigil","event":"<kind>","ts":<ms>,"count":<n>,"items":[...],"source":"native"}
std::string CreateEventJson(MonitorEvent event, const MonitorSnapshot& snapshot, int64_t timestampMs);

int64_t ToEpochMillis(std::chrono::system_clock::time_point timestamp);

#endif // DETECTION_JSON_H
