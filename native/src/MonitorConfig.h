#ifndef MONITOR_CONFIG_H
#define MONITOR_CONFIG_H

#include <string>
#include <vector>

#include "CommonTypes.h"

const int kDefaultBasicIntervalMs = 2000;
const int kDefaultAdvancedIntervalMs = 30000;
const int kDefaultNetworkIntervalMs = 10000;
const int kDefaultUtilityTimeoutMs = 5000;
const int kDefaultDnsTimeoutMs = 2000;

struct MonitorConfig {
    std::vector<std::string> forbiddenApps;

    std::vector<std::string> suspiciousNames;
    std::vector<std::string> suspiciousPaths;
    std::vector<std::string> suspiciousHashes;

    bool enableAdvancedDetection;
    int windowThreshold;
    int screenEvasionThreshold;

    PlanType planType;

    int basicIntervalMs;
    int advancedIntervalMs;
    int networkIntervalMs;
    int utilityTimeoutMs;
    int dnsTimeoutMs;

    MonitorConfig() : enableAdvancedDetection(false), windowThreshold(3), screenEvasionThreshold(2),
                      planType(PlanType::Free),
                      basicIntervalMs(kDefaultBasicIntervalMs),
                      advancedIntervalMs(kDefaultAdvancedIntervalMs),
                      networkIntervalMs(kDefaultNetworkIntervalMs),
                      utilityTimeoutMs(kDefaultUtilityTimeoutMs),
                      dnsTimeoutMs(kDefaultDnsTimeoutMs) {}

    // Drops empty list entries, which would match every process by substring.
    // Non-positive cadences and timeouts fall back to the defaults.
    void Normalize();
};

PlanType ParsePlanType(const std::string& value);

#endif // MONITOR_CONFIG_H
