#include "ProcessBridge.h"

#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include <dirent.h>
#include <unistd.h>
#include <limits.h>

namespace {

// RAII wrapper for DIR*
class DirHandle {
public:
    explicit DirHandle(const char* path) : dir_(opendir(path)) {
        if (!dir_) {
            throw BridgeException(BridgeStatus::SystemCall,
                                  std::string("Failed to open ") + path + ": " + strerror(errno));
        }
    }

    ~DirHandle() {
        if (dir_) {
            closedir(dir_);
        }
    }

    DirHandle(const DirHandle&) = delete;
    DirHandle& operator=(const DirHandle&) = delete;

    DIR* get() { return dir_; }

private:
    DIR* dir_;
};

int ParsePid(const char* entry) {
    if (!entry || *entry == '\0') return 0;

    char* end = nullptr;
    long value = std::strtol(entry, &end, 10);
    if (*end != '\0' || value <= 0 || value > INT_MAX) {
        return 0;
    }
    return static_cast<int>(value);
}

bool ReadProcessName(int pid, std::string& name) {
    std::ifstream comm("/proc/" + std::to_string(pid) + "/comm");
    if (!comm || !std::getline(comm, name)) {
        return false;
    }
    return !name.empty();
}

// No compositor registry is queried on this platform
class ProcfsWindowInspector : public WindowInspector {
public:
    bool IsAvailable() const override {
        return false;
    }

    int WindowCount(int pid) override {
        RequireValidPid(pid);
        return 0;
    }

    int DetectScreenEvasion(int pid) override {
        RequireValidPid(pid);
        return 0;
    }

    int DetectElevatedLayers(int pid) override {
        RequireValidPid(pid);
        return 0;
    }

    WindowProperties GetWindowProperties(int pid) override {
        RequireValidPid(pid);
        return WindowProperties();
    }

private:
    static void RequireValidPid(int pid) {
        if (pid <= 0) {
            throw std::invalid_argument("Window query requires pid > 0, got " + std::to_string(pid));
        }
    }
};

class ProcfsProcessInspector : public ProcessInspector {
public:
    explicit ProcfsProcessInspector(std::shared_ptr<WindowInspector> windows)
        : windows_(windows) {}

    std::vector<ProcessSnapshot> ListProcesses() override {
        std::vector<ProcessSnapshot> processes;
        DirHandle proc("/proc");
        bool haveWindows = windows_ && windows_->IsAvailable();

        struct dirent* entry;
        while ((entry = readdir(proc.get())) != nullptr) {
            int pid = ParsePid(entry->d_name);
            if (pid <= 0) continue;

            // Process may have exited since readdir
            std::string name;
            if (!ReadProcessName(pid, name)) continue;

            ProcessSnapshot snapshot(pid, name, GetProcessPath(pid));

            if (haveWindows) {
                try {
                    snapshot.windowCount = windows_->WindowCount(pid);
                    snapshot.screenEvasionCount = windows_->DetectScreenEvasion(pid);
                    snapshot.elevatedLayerCount = windows_->DetectElevatedLayers(pid);
                    snapshot.suspiciousWindowCount =
                        (snapshot.screenEvasionCount > 0 || snapshot.elevatedLayerCount > 0) ? 1 : 0;
                } catch (const std::exception& e) {
                    std::cerr << "[ProcessBridge] Window counters unavailable for PID " << pid
                              << ": " << e.what() << std::endl;
                }
            }

            processes.push_back(snapshot);
        }

        return processes;
    }

    std::vector<GuiApplication> ListGuiApplications() override {
        return std::vector<GuiApplication>();
    }

    std::string GetProcessPath(int pid) override {
        if (pid <= 0) return std::string();

        char buffer[PATH_MAX];
        std::string link = "/proc/" + std::to_string(pid) + "/exe";
        ssize_t len = readlink(link.c_str(), buffer, sizeof(buffer) - 1);
        if (len <= 0) {
            return std::string();
        }
        buffer[len] = '\0';
        return std::string(buffer);
    }

private:
    std::shared_ptr<WindowInspector> windows_;
};

} // namespace

std::shared_ptr<WindowInspector> CreateSystemWindowInspector() {
    return std::make_shared<ProcfsWindowInspector>();
}

std::shared_ptr<ProcessInspector> CreateSystemProcessInspector(std::shared_ptr<WindowInspector> windows) {
    return std::make_shared<ProcfsProcessInspector>(windows);
}
