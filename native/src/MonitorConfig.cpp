#include "MonitorConfig.h"
#include "StringUtils.h"

#include <algorithm>

namespace {

void DropEmptyEntries(std::vector<std::string>& entries) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const std::string& entry) { return entry.empty(); }),
                  entries.end());
}

} // namespace

void MonitorConfig::Normalize() {
    DropEmptyEntries(forbiddenApps);
    DropEmptyEntries(suspiciousNames);
    DropEmptyEntries(suspiciousPaths);
    DropEmptyEntries(suspiciousHashes);

    if (basicIntervalMs <= 0) basicIntervalMs = kDefaultBasicIntervalMs;
    if (advancedIntervalMs <= 0) advancedIntervalMs = kDefaultAdvancedIntervalMs;
    if (networkIntervalMs <= 0) networkIntervalMs = kDefaultNetworkIntervalMs;
    if (utilityTimeoutMs <= 0) utilityTimeoutMs = kDefaultUtilityTimeoutMs;
    if (dnsTimeoutMs <= 0) dnsTimeoutMs = kDefaultDnsTimeoutMs;
}

PlanType ParsePlanType(const std::string& value) {
    return ToLower(Trim(value)) == "pro" ? PlanType::Pro : PlanType::Free;
}
