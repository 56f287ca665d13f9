#include "DetectionJson.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

TEST(DetectionJsonTest, ForbiddenAppsEvent) {
    MonitorSnapshot snapshot;
    snapshot.forbiddenApps = {"Discord (PID: 600)", "Zoom (Bundle: us.zoom.xos)"};

    EXPECT_EQ(CreateEventJson(MonitorEvent::ForbiddenApps, snapshot, 1700000000123LL),
              "{\"module\":\"vigil\",\"event\":\"forbidden-apps\",\"ts\":1700000000123,\"count\":2,"
              "\"items\":[\"Discord (PID: 600)\",\"Zoom (Bundle: us.zoom.xos)\"],\"source\":\"native\"}");
}

TEST(DetectionJsonTest, EmptyListStillCarriesEnvelope) {
    MonitorSnapshot snapshot;

    EXPECT_EQ(CreateEventJson(MonitorEvent::AdvancedDetections, snapshot, 5),
              "{\"module\":\"vigil\",\"event\":\"advanced-detections\",\"ts\":5,\"count\":0,"
              "\"items\":[],\"source\":\"native\"}");
}

TEST(DetectionJsonTest, EventCarriesOnlyItsOwnList) {
    MonitorSnapshot snapshot;
    snapshot.forbiddenApps = {"Discord (PID: 600)"};
    SuspiciousProcessResult result;
    result.type = DetectionType::Path;
    result.processName = "Cluely";
    result.processPath = "/Applications/Cluely.app/Contents/MacOS/Cluely";
    result.pid = 500;
    result.message = "Suspicious process path detected: Cluely";
    snapshot.suspiciousProcesses.push_back(result);

    std::string json = CreateEventJson(MonitorEvent::SuspiciousProcesses, snapshot, 1);

    EXPECT_NE(json.find("\"event\":\"suspicious-processes\""), std::string::npos);
    EXPECT_NE(json.find("\"count\":1"), std::string::npos);
    EXPECT_NE(json.find("\"type\":\"path\""), std::string::npos);
    EXPECT_EQ(json.find("Discord"), std::string::npos);
}

TEST(DetectionJsonTest, AdvancedResultFields) {
    AdvancedDetectionResult result;
    result.confidence = DetectionConfidence::Suspicious;
    result.type = DetectionType::ScreenEvasion;
    result.processName = "OverlayTool";
    result.pid = 77;
    result.message = "[SUSPICIOUS] Screen evasion";
    result.evidence = {"2 windows off-screen", "Threshold: 2"};

    EXPECT_EQ(ToJson(result),
              "{\"confidence\":\"SUSPICIOUS\",\"type\":\"screen_evasion\",\"processName\":\"OverlayTool\","
              "\"processPath\":\"\",\"pid\":77,\"message\":\"[SUSPICIOUS] Screen evasion\","
              "\"evidence\":[\"2 windows off-screen\",\"Threshold: 2\"]}");
}

TEST(DetectionJsonTest, NetworkResultUsesEpochMillis) {
    NetworkDetectionResult result;
    result.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000456LL));
    result.processName = "chrome";
    result.pid = 321;
    result.destinationDomain = "api.openai.com";
    result.destinationPort = 443;
    result.connectionProtocol = "HTTPS";
    result.confidence = NetworkConfidence::Definitive;
    result.message = "msg";

    std::string json = ToJson(result);

    EXPECT_EQ(ToEpochMillis(result.timestamp), 1700000000456LL);
    EXPECT_EQ(json.find("{\"timestamp\":1700000000456,"), 0u);
    EXPECT_NE(json.find("\"destinationPort\":443"), std::string::npos);
    EXPECT_NE(json.find("\"protocol\":\"HTTPS\""), std::string::npos);
    EXPECT_NE(json.find("\"confidence\":\"DEFINITIVE\""), std::string::npos);
    EXPECT_NE(json.find("\"evidence\":[]"), std::string::npos);
}

TEST(DetectionJsonTest, StringsAreEscaped) {
    MonitorSnapshot snapshot;
    snapshot.forbiddenApps = {"Bad \"App\"\\ (Path: /tmp/a\nb)"};

    std::string json = CreateEventJson(MonitorEvent::ForbiddenApps, snapshot, 0);

    EXPECT_NE(json.find("Bad \\\"App\\\"\\\\ (Path: /tmp/a\\nb)"), std::string::npos);
}
