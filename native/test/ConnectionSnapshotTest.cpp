#include "ConnectionSnapshot.h"

#include <gtest/gtest.h>

TEST(ConnectionSnapshotTest, ParsesIpv4Connection) {
    ParsedConnection connection;

    ASSERT_TRUE(ParseConnectionLine(
        "chrome 1234 user 5u IPv4 0x0 0t0 TCP 10.0.0.2:51000->93.184.216.34:443", connection));

    EXPECT_EQ(connection.processName, "chrome");
    EXPECT_EQ(connection.pid, 1234);
    EXPECT_EQ(connection.remoteHost, "93.184.216.34");
    EXPECT_EQ(connection.remotePort, 443);
}

TEST(ConnectionSnapshotTest, ParsingIsRepeatable) {
    const std::string line = "chrome 1234 user 5u IPv4 0x0 0t0 TCP 10.0.0.2:51000->93.184.216.34:443";
    ParsedConnection first;
    ParsedConnection second;

    ASSERT_TRUE(ParseConnectionLine(line, first));
    ASSERT_TRUE(ParseConnectionLine(line, second));
    EXPECT_EQ(first.remoteHost, second.remoteHost);
    EXPECT_EQ(first.remotePort, second.remotePort);
}

TEST(ConnectionSnapshotTest, ToleratesStateSuffix) {
    ParsedConnection connection;

    ASSERT_TRUE(ParseConnectionLine(
        "Slack 812 alice 41u IPv4 0xabc123 0t0 TCP 192.168.1.4:60211->34.120.195.249:443 (ESTABLISHED)",
        connection));

    EXPECT_EQ(connection.processName, "Slack");
    EXPECT_EQ(connection.remoteHost, "34.120.195.249");
    EXPECT_EQ(connection.remotePort, 443);
}

TEST(ConnectionSnapshotTest, ParsesBracketedIpv6) {
    ParsedConnection connection;

    ASSERT_TRUE(ParseConnectionLine(
        "curl 4321 bob 3u IPv6 0x0 0t0 TCP [2001:db8::2]:50000->[2606:4700::6810:84e5]:443 (ESTABLISHED)",
        connection));

    EXPECT_EQ(connection.remoteHost, "2606:4700::6810:84e5");
    EXPECT_EQ(connection.remotePort, 443);
}

TEST(ConnectionSnapshotTest, SkipsHeaderAndMalformedLines) {
    ParsedConnection connection;

    EXPECT_FALSE(ParseConnectionLine("COMMAND PID USER FD TYPE DEVICE SIZE/OFF NODE NAME", connection));
    EXPECT_FALSE(ParseConnectionLine("", connection));
    EXPECT_FALSE(ParseConnectionLine("chrome 1234 user 5u IPv4 0x0 0t0 TCP *:443 (LISTEN)", connection));
    EXPECT_FALSE(ParseConnectionLine("chrome abc user 5u IPv4 0x0 0t0 TCP 10.0.0.2:1->1.2.3.4:443", connection));
    EXPECT_FALSE(ParseConnectionLine("chrome 1234 10.0.0.2:1->1.2.3.4:443", connection));
}

TEST(ConnectionSnapshotTest, ListingKeepsOnlyParsableLines) {
    const std::string output =
        "COMMAND   PID  USER   FD   TYPE DEVICE SIZE/OFF NODE NAME\n"
        "chrome   1234  user   5u  IPv4 0x0      0t0  TCP 10.0.0.2:51000->93.184.216.34:443 (ESTABLISHED)\n"
        "garbage line\n"
        "python3  2222  user   7u  IPv4 0x0      0t0  TCP 10.0.0.2:51001->104.18.7.192:80 (ESTABLISHED)\n";

    std::vector<ParsedConnection> connections = ParseConnectionListing(output);

    ASSERT_EQ(connections.size(), 2u);
    EXPECT_EQ(connections[0].pid, 1234);
    EXPECT_EQ(connections[1].processName, "python3");
    EXPECT_EQ(connections[1].remotePort, 80);
}

TEST(ConnectionSnapshotTest, SplitHostPortSplitsOnLastColon) {
    std::string host;
    int port = 0;

    ASSERT_TRUE(SplitHostPort("api.openai.com:443", host, port));
    EXPECT_EQ(host, "api.openai.com");
    EXPECT_EQ(port, 443);

    ASSERT_TRUE(SplitHostPort("fe80::1:8080", host, port));
    EXPECT_EQ(host, "fe80::1");
    EXPECT_EQ(port, 8080);

    EXPECT_FALSE(SplitHostPort("nohostport", host, port));
    EXPECT_FALSE(SplitHostPort(":443", host, port));
}

TEST(ConnectionSnapshotTest, IpLiteralDetection) {
    EXPECT_TRUE(IsIpLiteral("93.184.216.34"));
    EXPECT_TRUE(IsIpLiteral("2606:4700::6810:84e5"));
    EXPECT_FALSE(IsIpLiteral("api.openai.com"));
    EXPECT_FALSE(IsIpLiteral(""));
}

TEST(ConnectionSnapshotTest, ResolverIgnoresHostNames) {
    ReverseDnsResolver resolver(100);

    EXPECT_EQ(resolver.Resolve("api.openai.com"), "");
    EXPECT_EQ(resolver.Resolve("localhost"), "");
}
