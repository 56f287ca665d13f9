#include "NetworkMonitor.h"
#include "StringUtils.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace {

// Known LLM API endpoints, a match is definitive
const char* const kLlmApiDomains[] = {
    "api.openai.com",
    "api.anthropic.com",
    "api.cohere.ai",
    "api.together.xyz",
    "api.replicate.com",
    "api.huggingface.co",
    "generativelanguage.googleapis.com",
    "claude.ai",
    "chat.openai.com",
    "bard.google.com",
    "copilot.microsoft.com",
    "api.mistral.ai",
    "api.groq.com",
    "api.perplexity.ai"
};

const char* const kAiRelatedDomains[] = {
    "openai.com",
    "anthropic.com",
    "huggingface.co",
    "replicate.com",
    "runpod.io",
    "modal.com",
    "kaggle.com",
    "colab.research.google.com"
};

const char* const kAiHostKeywords[] = {
    "ai", "ml", "gpt", "claude", "llm", "chatbot", "assistant"
};

// Process names of desktop LLM clients and the shells they ship in
const char* const kLlmClientProcessHints[] = {
    "chatgpt", "claude", "openai", "anthropic", "electron", "desktop"
};

const char* const kLlmDestinationHints[] = {
    "openai.com", "anthropic.com", "claude.ai"
};

typedef std::map<std::string, std::vector<std::string>> DestinationsByProcess;

bool IsLikelyLlmClient(const std::string& processKey, const std::vector<std::string>& destinations) {
    std::string lowerKey = ToLower(processKey);
    for (const char* hint : kLlmClientProcessHints) {
        if (Contains(lowerKey, hint)) {
            return true;
        }
    }
    for (const auto& destination : destinations) {
        for (const char* hint : kLlmDestinationHints) {
            if (Contains(destination, hint)) {
                return true;
            }
        }
    }
    return false;
}

void AppendProcessGroup(std::vector<std::string>& lines, const std::string& processKey,
                        const std::vector<std::string>& destinations) {
    lines.push_back("  " + processKey + ":");
    for (const auto& destination : destinations) {
        lines.push_back("    \xE2\x86\x92 " + destination);
    }
}

std::string DescribeConnection(const NetworkDetectionResult& detection) {
    return detection.processName + " (PID: " + std::to_string(detection.pid) + ") \xE2\x86\x92 " +
           detection.destinationDomain;
}

void AppendTier(std::vector<std::string>& lines, const std::string& heading,
                const std::vector<const NetworkDetectionResult*>& tier, size_t shown) {
    if (tier.empty()) {
        return;
    }

    lines.push_back("  " + heading + " (" + std::to_string(tier.size()) + "):");
    for (size_t i = 0; i < tier.size() && i < shown; i++) {
        lines.push_back("    - " + DescribeConnection(*tier[i]));
    }
    if (tier.size() > shown) {
        lines.push_back("    - ... and " + std::to_string(tier.size() - shown) + " more");
    }
}

} // namespace

NetworkMonitor::NetworkMonitor(std::shared_ptr<ConnectionSource> connections,
                               std::shared_ptr<HostResolver> resolver,
                               std::shared_ptr<ProcessInspector> processes)
    : connections_(connections), resolver_(resolver), processes_(processes), summaryLogged_(false) {
}

NetworkMonitor::~NetworkMonitor() {
}

std::string NetworkMonitor::ProtocolForPort(int port) {
    return port == 443 ? "HTTPS" : "HTTP";
}

DestinationAnalysis NetworkMonitor::AnalyzeDestination(const std::string& host, int port) {
    DestinationAnalysis analysis;
    std::string lowerHost = ToLower(host);

    for (const char* apiDomain : kLlmApiDomains) {
        if (Contains(lowerHost, apiDomain)) {
            analysis.confidence = NetworkConfidence::Definitive;
            analysis.evidence.push_back(std::string("Direct API call to ") + apiDomain);
            analysis.evidence.push_back("Port: " + std::to_string(port) + " (" + ProtocolForPort(port) + ")");
            return analysis;
        }
    }

    for (const char* aiDomain : kAiRelatedDomains) {
        if (Contains(lowerHost, aiDomain)) {
            analysis.confidence = NetworkConfidence::Suspicious;
            analysis.evidence.push_back(std::string("Connection to AI/ML service: ") + aiDomain);
            analysis.evidence.push_back("Port: " + std::to_string(port));
            return analysis;
        }
    }

    for (const char* keyword : kAiHostKeywords) {
        if (Contains(lowerHost, keyword)) {
            analysis.confidence = NetworkConfidence::Suspicious;
            analysis.evidence.push_back(std::string("Domain contains AI-related keyword: ") + keyword);
            analysis.evidence.push_back("Full domain: " + host);
            return analysis;
        }
    }

    return analysis;
}

bool NetworkMonitor::CheckNetworkConnections(std::vector<NetworkDetectionResult>& detections) {
    detections.clear();

    std::string output;
    if (!connections_ || !connections_->ListEstablished(output)) {
        std::cerr << "[NetworkMonitor] Connection listing unavailable, skipping cycle" << std::endl;
        return false;
    }

    auto timestamp = std::chrono::system_clock::now();
    std::vector<ParsedConnection> parsed = ParseConnectionListing(output);
    std::map<std::string, std::string> resolvedHosts;
    for (const auto& connection : parsed) {
        auto cached = resolvedHosts.find(connection.remoteHost);
        if (cached == resolvedHosts.end()) {
            std::string resolved = resolver_ ? resolver_->Resolve(connection.remoteHost) : std::string();
            cached = resolvedHosts.insert(std::make_pair(connection.remoteHost, resolved)).first;
        }
        detections.push_back(AnalyzeConnection(connection, cached->second, timestamp));
    }

    if (!detections.empty()) {
        std::cout << "[NetworkMonitor] Found " << detections.size() << " outbound connections" << std::endl;
    }
    for (const auto& line : DescribeOutboundConnections(detections)) {
        std::cout << "[NetworkMonitor] " << line << std::endl;
    }
    return true;
}

NetworkDetectionResult NetworkMonitor::AnalyzeConnection(const ParsedConnection& connection,
                                                         const std::string& resolvedHost,
                                                         std::chrono::system_clock::time_point timestamp) {
    const std::string& hostToAnalyze = resolvedHost.empty() ? connection.remoteHost : resolvedHost;

    DestinationAnalysis analysis = AnalyzeDestination(hostToAnalyze, connection.remotePort);

    NetworkDetectionResult detection;
    detection.timestamp = timestamp;
    detection.processName = connection.processName;
    detection.pid = connection.pid;
    detection.destinationDomain = hostToAnalyze;
    detection.destinationPort = connection.remotePort;
    detection.connectionProtocol = ProtocolForPort(connection.remotePort);
    detection.confidence = analysis.confidence;
    detection.evidence = analysis.evidence;

    if (processes_) {
        detection.processPath = processes_->GetProcessPath(connection.pid);
    }

    std::string displayHost = resolvedHost.empty()
        ? connection.remoteHost
        : resolvedHost + " (" + connection.remoteHost + ")";
    detection.message = std::string("[") + ToString(analysis.confidence) + "] " + connection.processName +
                        " \xE2\x86\x92 " + displayHost + ":" + std::to_string(connection.remotePort);

    return detection;
}

std::vector<NetworkDetectionResult> NetworkMonitor::MergeDetections(
    const std::vector<NetworkDetectionResult>& existing,
    const std::vector<NetworkDetectionResult>& incoming,
    std::chrono::system_clock::time_point now) {
    const auto retention = std::chrono::seconds(kNetworkRetentionSec);
    const auto dedupWindow = std::chrono::seconds(kNetworkDedupWindowSec);

    std::vector<NetworkDetectionResult> merged;
    for (const auto& detection : existing) {
        if (detection.timestamp > now - retention) {
            merged.push_back(detection);
        }
    }

    for (const auto& detection : incoming) {
        bool duplicate = false;
        for (const auto& kept : merged) {
            if (kept.pid != detection.pid || kept.destinationDomain != detection.destinationDomain) {
                continue;
            }
            auto age = detection.timestamp > kept.timestamp
                ? detection.timestamp - kept.timestamp
                : kept.timestamp - detection.timestamp;
            if (age < dedupWindow) {
                duplicate = true;
                break;
            }
        }

        if (!duplicate) {
            merged.push_back(detection);
        }
    }

    return merged;
}

std::vector<std::string> NetworkMonitor::DescribeLlmActivity(const std::vector<NetworkDetectionResult>& detections) {
    std::vector<const NetworkDetectionResult*> definitive;
    std::vector<const NetworkDetectionResult*> suspicious;
    for (const auto& detection : detections) {
        if (detection.confidence == NetworkConfidence::Definitive) {
            definitive.push_back(&detection);
        } else if (detection.confidence == NetworkConfidence::Suspicious) {
            suspicious.push_back(&detection);
        }
    }

    std::vector<std::string> lines;
    if (definitive.empty() && suspicious.empty()) {
        return lines;
    }

    lines.push_back("NETWORK LLM ACTIVITY DETECTED:");
    AppendTier(lines, "DEFINITIVE LLM APIs", definitive, 3);
    AppendTier(lines, "SUSPICIOUS AI-RELATED", suspicious, 2);
    return lines;
}

std::vector<std::string> NetworkMonitor::DescribeOutboundConnections(
    const std::vector<NetworkDetectionResult>& detections) {
    std::vector<std::string> lines;
    if (detections.empty()) {
        lines.push_back("No outbound connections found");
        return lines;
    }

    DestinationsByProcess byProcess;
    for (const auto& detection : detections) {
        std::string processKey = detection.processName + " (PID: " + std::to_string(detection.pid) + ")";
        std::string destination = detection.destinationDomain + ":" + std::to_string(detection.destinationPort);
        std::vector<std::string>& destinations = byProcess[processKey];
        if (std::find(destinations.begin(), destinations.end(), destination) == destinations.end()) {
            destinations.push_back(destination);
        }
    }

    lines.push_back("ALL OUTBOUND CONNECTIONS (" + std::to_string(detections.size()) + " total):");

    bool suspectHeading = false;
    for (const auto& entry : byProcess) {
        if (!IsLikelyLlmClient(entry.first, entry.second)) {
            continue;
        }
        if (!suspectHeading) {
            lines.push_back("POTENTIAL LLM/AI PROCESSES:");
            suspectHeading = true;
        }
        AppendProcessGroup(lines, entry.first, entry.second);
    }

    if (suspectHeading) {
        lines.push_back("ALL PROCESSES:");
    }
    for (const auto& entry : byProcess) {
        AppendProcessGroup(lines, entry.first, entry.second);
    }
    return lines;
}

void NetworkMonitor::MaybeLogSummary(double scanSeconds, const std::vector<NetworkDetectionResult>& fresh,
                                     size_t retainedCount) {
    {
        std::lock_guard<std::mutex> lock(summaryMutex_);
        auto now = std::chrono::steady_clock::now();
        if (summaryLogged_ && now - lastSummary_ < std::chrono::seconds(kNetworkSummaryIntervalSec)) {
            return;
        }
        summaryLogged_ = true;
        lastSummary_ = now;
    }

    int definitiveCount = 0;
    int suspiciousCount = 0;
    for (const auto& detection : fresh) {
        if (detection.confidence == NetworkConfidence::Definitive) definitiveCount++;
        if (detection.confidence == NetworkConfidence::Suspicious) suspiciousCount++;
    }

    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(2) << scanSeconds;
    std::cout << "[NetworkMonitor] Network scan completed in " << elapsed.str() << "s - Found "
              << fresh.size() << " new connections (" << retainedCount << " total active)" << std::endl;

    if (definitiveCount == 0 && suspiciousCount == 0) {
        return;
    }

    std::cout << "[NetworkMonitor] LLM API ACTIVITY DETECTED:" << std::endl;
    std::cout << "[NetworkMonitor]   DEFINITIVE (LLM APIs): " << definitiveCount << std::endl;
    std::cout << "[NetworkMonitor]   SUSPICIOUS (AI-related): " << suspiciousCount << std::endl;

    int index = 0;
    for (const auto& detection : fresh) {
        if (detection.confidence != NetworkConfidence::Definitive) {
            continue;
        }
        std::cout << "[NetworkMonitor]   " << (index + 1) << ". " << DescribeConnection(detection) << std::endl;
        if (++index == 5) {
            break;
        }
    }
}
