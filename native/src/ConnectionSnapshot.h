#ifndef CONNECTION_SNAPSHOT_H
#define CONNECTION_SNAPSHOT_H

#include <string>
#include <vector>

#include "CommonTypes.h"

// One established outbound TCP connection parsed from the listing utility
struct ParsedConnection {
    std::string processName;
    int pid;
    std::string remoteHost;
    int remotePort;

    ParsedConnection() : pid(0), remotePort(0) {}
};

// Produces lines in the form
//   COMMAND PID USER FD TYPE DEVICE SIZE/OFF NODE NAME
// where NAME holds "local->remote" for established connections
class ConnectionSource {
public:
    virtual ~ConnectionSource() {}

    // Returns false when the utility could not be run or did not finish in time
    virtual bool ListEstablished(std::string& output) = 0;
};

class HostResolver {
public:
    virtual ~HostResolver() {}

    // Reverse lookup of an IP literal; empty when it is not an IP or has no useful name
    virtual std::string Resolve(const std::string& host) = 0;
};

// Runs lsof -i -n -P -sTCP:ESTABLISHED, killing it after timeoutMs
class LsofConnectionSource : public ConnectionSource {
public:
    explicit LsofConnectionSource(int timeoutMs = 5000);

    bool ListEstablished(std::string& output) override;

private:
    int timeoutMs_;

    std::string FindLsof() const;
};

// getnameinfo() bounded by timeoutMs; a lookup that overruns is abandoned
class ReverseDnsResolver : public HostResolver {
public:
    explicit ReverseDnsResolver(int timeoutMs = 2000);

    std::string Resolve(const std::string& host) override;

private:
    int timeoutMs_;
};

bool ParseConnectionLine(const std::string& line, ParsedConnection& connection);
std::vector<ParsedConnection> ParseConnectionListing(const std::string& output);

// Splits "host:port" or "[v6addr]:port"
bool SplitHostPort(const std::string& endpoint, std::string& host, int& port);

bool IsIpLiteral(const std::string& host);

#endif // CONNECTION_SNAPSHOT_H
