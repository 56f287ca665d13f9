#ifndef NETWORK_MONITOR_H
#define NETWORK_MONITOR_H

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "CommonTypes.h"
#include "ConnectionSnapshot.h"
#include "ProcessBridge.h"

struct DestinationAnalysis {
    NetworkConfidence confidence;
    std::vector<std::string> evidence;

    DestinationAnalysis() : confidence(NetworkConfidence::Informational) {}
};

// Seconds a detection stays in the published window
const int kNetworkRetentionSec = 300;
// Same (pid, domain) seen again within this many seconds is a duplicate
const int kNetworkDedupWindowSec = 60;
const int kNetworkSummaryIntervalSec = 30;

class NetworkMonitor {
public:
    NetworkMonitor(std::shared_ptr<ConnectionSource> connections,
                   std::shared_ptr<HostResolver> resolver,
                   std::shared_ptr<ProcessInspector> processes);
    ~NetworkMonitor();

    static DestinationAnalysis AnalyzeDestination(const std::string& host, int port);

    // One scan of established outbound connections. Every parsed connection
    // yields a result, informational ones included. Each distinct remote host
    // is resolved once per scan. Returns false when the connection listing
    // could not be obtained this cycle.
    bool CheckNetworkConnections(std::vector<NetworkDetectionResult>& detections);

    // resolvedHost is the reverse lookup of connection.remoteHost, empty when it failed
    NetworkDetectionResult AnalyzeConnection(const ParsedConnection& connection,
                                             const std::string& resolvedHost,
                                             std::chrono::system_clock::time_point timestamp);

    // Drops entries older than the retention window, then appends every
    // incoming detection that is not a recent duplicate.
    static std::vector<NetworkDetectionResult> MergeDetections(
        const std::vector<NetworkDetectionResult>& existing,
        const std::vector<NetworkDetectionResult>& incoming,
        std::chrono::system_clock::time_point now);

    // Console digest of definitive and suspicious connections, empty when there are none
    static std::vector<std::string> DescribeLlmActivity(const std::vector<NetworkDetectionResult>& detections);

    // Every connection of one scan grouped by process, likely LLM clients listed first
    static std::vector<std::string> DescribeOutboundConnections(const std::vector<NetworkDetectionResult>& detections);

    // Logs at most once per summary interval
    void MaybeLogSummary(double scanSeconds, const std::vector<NetworkDetectionResult>& fresh, size_t retainedCount);

    static std::string ProtocolForPort(int port);

private:
    std::shared_ptr<ConnectionSource> connections_;
    std::shared_ptr<HostResolver> resolver_;
    std::shared_ptr<ProcessInspector> processes_;

    std::mutex summaryMutex_;
    bool summaryLogged_;
    std::chrono::steady_clock::time_point lastSummary_;
};

#endif // NETWORK_MONITOR_H
