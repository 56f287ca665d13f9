#include "ConnectionSnapshot.h"
#include "StringUtils.h"

#include <chrono>
#include <condition_variable>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

const char* const kLsofCandidates[] = {
    "/usr/sbin/lsof", "/usr/bin/lsof", "/sbin/lsof", "/bin/lsof"
};

// Closes both pipe ends that are still open
class Pipe {
public:
    Pipe() : ok_(pipe(fds_) == 0) {
        if (!ok_) {
            fds_[0] = fds_[1] = -1;
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool ok() const { return ok_; }
    int readEnd() const { return fds_[0]; }
    int writeEnd() const { return fds_[1]; }

    void CloseRead() {
        if (fds_[0] >= 0) { close(fds_[0]); fds_[0] = -1; }
    }
    void CloseWrite() {
        if (fds_[1] >= 0) { close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2];
    bool ok_;
};

class SpawnActions {
public:
    SpawnActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

struct LookupState {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::string name;
};

std::string LookupName(const std::string& host) {
    struct sockaddr_storage storage;
    memset(&storage, 0, sizeof(storage));
    socklen_t length = 0;

    struct sockaddr_in* v4 = reinterpret_cast<struct sockaddr_in*>(&storage);
    struct sockaddr_in6* v6 = reinterpret_cast<struct sockaddr_in6*>(&storage);

    if (inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        length = sizeof(struct sockaddr_in);
    } else if (inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        length = sizeof(struct sockaddr_in6);
    } else {
        return std::string();
    }

    char name[NI_MAXHOST];
    if (getnameinfo(reinterpret_cast<struct sockaddr*>(&storage), length,
                    name, sizeof(name), nullptr, 0, NI_NAMEREQD) != 0) {
        return std::string();
    }
    return std::string(name);
}

} // namespace

// Parsing

bool SplitHostPort(const std::string& endpoint, std::string& host, int& port) {
    host.clear();
    port = 0;

    std::string remote = Trim(endpoint);
    if (remote.empty()) {
        return false;
    }

    if (remote[0] == '[') {
        size_t bracketEnd = remote.find(']');
        if (bracketEnd == std::string::npos) {
            return false;
        }
        host = remote.substr(1, bracketEnd - 1);

        size_t colon = remote.find(':', bracketEnd);
        if (colon != std::string::npos && !ParseInt(remote.substr(colon + 1), port)) {
            port = 0;
        }
    } else {
        // IPv6 literals contain colons, only the last one separates the port
        size_t colon = remote.rfind(':');
        if (colon == std::string::npos) {
            return false;
        }
        host = remote.substr(0, colon);
        if (!ParseInt(remote.substr(colon + 1), port)) {
            port = 0;
        }
    }

    return !host.empty();
}

bool ParseConnectionLine(const std::string& line, ParsedConnection& connection) {
    std::string trimmed = Trim(line);
    if (trimmed.empty() || StartsWith(trimmed, "COMMAND")) {
        return false;
    }

    std::vector<std::string> tokens = SplitWhitespace(trimmed);
    if (tokens.size() < 9) {
        return false;
    }

    int pid = 0;
    if (!ParseInt(tokens[1], pid) || pid <= 0) {
        return false;
    }

    std::string endpoints;
    for (size_t i = 8; i < tokens.size(); i++) {
        if (Contains(tokens[i], "->")) {
            endpoints = tokens[i];
            break;
        }
    }
    if (endpoints.empty()) {
        return false;
    }

    std::string remote = endpoints.substr(endpoints.find("->") + 2);
    std::string host;
    int port = 0;
    if (!SplitHostPort(remote, host, port)) {
        return false;
    }

    connection.processName = tokens[0];
    connection.pid = pid;
    connection.remoteHost = host;
    connection.remotePort = port;
    return true;
}

std::vector<ParsedConnection> ParseConnectionListing(const std::string& output) {
    std::vector<ParsedConnection> connections;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        ParsedConnection connection;
        if (ParseConnectionLine(line, connection)) {
            connections.push_back(connection);
        }
    }

    return connections;
}

bool IsIpLiteral(const std::string& host) {
    unsigned char buffer[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buffer) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buffer) == 1;
}

// LsofConnectionSource

LsofConnectionSource::LsofConnectionSource(int timeoutMs) : timeoutMs_(timeoutMs) {
}

std::string LsofConnectionSource::FindLsof() const {
    for (const char* candidate : kLsofCandidates) {
        if (access(candidate, X_OK) == 0) {
            return candidate;
        }
    }
    return std::string();
}

bool LsofConnectionSource::ListEstablished(std::string& output) {
    output.clear();

    std::string lsof = FindLsof();
    if (lsof.empty()) {
        std::cerr << "[ConnectionSnapshot] lsof not found" << std::endl;
        return false;
    }

    Pipe out;
    if (!out.ok()) {
        std::cerr << "[ConnectionSnapshot] pipe() failed: " << strerror(errno) << std::endl;
        return false;
    }

    SpawnActions actions;
    posix_spawn_file_actions_adddup2(actions.get(), out.writeEnd(), STDOUT_FILENO);
    posix_spawn_file_actions_addclose(actions.get(), out.readEnd());
    posix_spawn_file_actions_addopen(actions.get(), STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<std::string> args = {lsof, "-i", "-n", "-P", "-sTCP:ESTABLISHED"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    pid_t child = 0;
    int spawnResult = posix_spawn(&child, lsof.c_str(), actions.get(), nullptr, argv.data(), environ);
    if (spawnResult != 0) {
        std::cerr << "[ConnectionSnapshot] Failed to launch " << lsof << ": " << strerror(spawnResult) << std::endl;
        return false;
    }
    out.CloseWrite();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs_);
    bool timedOut = false;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timedOut = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = out.readEnd();
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            timedOut = true;
            break;
        }
        if (ready == 0) {
            timedOut = true;
            break;
        }

        ssize_t bytesRead = read(out.readEnd(), buffer, sizeof(buffer));
        if (bytesRead < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (bytesRead == 0) {
            break;
        }
        output.append(buffer, static_cast<size_t>(bytesRead));
    }

    if (timedOut) {
        kill(child, SIGKILL);
    }

    int status = 0;
    while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
    }

    if (timedOut) {
        std::cerr << "[ConnectionSnapshot] lsof did not finish within " << timeoutMs_ << "ms, killed" << std::endl;
        output.clear();
        return false;
    }

    // lsof exits 1 when nothing matched
    if (!WIFEXITED(status)) {
        std::cerr << "[ConnectionSnapshot] lsof terminated abnormally" << std::endl;
        return false;
    }
    return true;
}

// ReverseDnsResolver

ReverseDnsResolver::ReverseDnsResolver(int timeoutMs) : timeoutMs_(timeoutMs) {
}

std::string ReverseDnsResolver::Resolve(const std::string& host) {
    if (host.empty() || Contains(host, "localhost") || !IsIpLiteral(host)) {
        return std::string();
    }

    // The lookup thread keeps the state alive if we stop waiting for it
    std::shared_ptr<LookupState> state = std::make_shared<LookupState>();
    std::thread([state, host]() {
        std::string name = LookupName(host);
        std::lock_guard<std::mutex> lock(state->mutex);
        state->name = name;
        state->done = true;
        state->done_cv.notify_all();
    }).detach();

    std::string name;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        if (!state->done_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs_),
                                     [&state]() { return state->done; })) {
            return std::string();
        }
        name = state->name;
    }

    // Reverse-IP pseudo names carry no information
    if (name.empty() || name == host || Contains(name, ".in-addr.arpa") ||
        Contains(name, ".ip6.arpa") || !Contains(name, ".")) {
        return std::string();
    }
    return name;
}
