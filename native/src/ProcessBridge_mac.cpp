#include "ProcessBridge.h"

#include <iostream>
#include <set>
#include <cstring>
#include <cerrno>

#include <sys/sysctl.h>
#include <sys/proc_info.h>
#include <libproc.h>
#include <unistd.h>
#include <CoreFoundation/CoreFoundation.h>
#include <CoreGraphics/CoreGraphics.h>
#include <ApplicationServices/ApplicationServices.h>

namespace {

// kCGWindowSharingNone: window content is excluded from screen capture
const int kSharingStateNone = 0;

int GetIntValue(CFDictionaryRef dict, CFStringRef key, int fallback) {
    CFNumberRef ref = (CFNumberRef)CFDictionaryGetValue(dict, key);
    if (!ref) {
        return fallback;
    }
    int value = fallback;
    CFNumberGetValue(ref, kCFNumberIntType, &value);
    return value;
}

std::string CFStringToStdString(CFStringRef str) {
    if (!str) return std::string();

    const char* direct = CFStringGetCStringPtr(str, kCFStringEncodingUTF8);
    if (direct) {
        return std::string(direct);
    }

    CFIndex length = CFStringGetLength(str);
    CFIndex maxSize = CFStringGetMaximumSizeForEncoding(length, kCFStringEncodingUTF8) + 1;
    std::string buffer(maxSize, '\0');
    if (!CFStringGetCString(str, &buffer[0], maxSize, kCFStringEncodingUTF8)) {
        return std::string();
    }
    buffer.resize(strlen(buffer.c_str()));
    return buffer;
}

// Owns the array returned by CGWindowListCopyWindowInfo
class WindowList {
public:
    explicit WindowList(CGWindowListOption option)
        : list_(CGWindowListCopyWindowInfo(option, kCGNullWindowID)) {}

    ~WindowList() {
        if (list_) {
            CFRelease(list_);
        }
    }

    WindowList(const WindowList&) = delete;
    WindowList& operator=(const WindowList&) = delete;

    bool valid() const { return list_ != nullptr; }
    CFIndex count() const { return list_ ? CFArrayGetCount(list_) : 0; }

    CFDictionaryRef at(CFIndex i) const {
        return (CFDictionaryRef)CFArrayGetValueAtIndex(list_, i);
    }

private:
    CFArrayRef list_;
};

bool IsOwnedBy(CFDictionaryRef window, int pid) {
    return GetIntValue(window, kCGWindowOwnerPID, -1) == pid;
}

int CountEvasion(CFDictionaryRef window) {
    int count = 0;

    CFDictionaryRef bounds = (CFDictionaryRef)CFDictionaryGetValue(window, kCGWindowBounds);
    if (bounds) {
        CGRect rect;
        if (CGRectMakeWithDictionaryRepresentation(bounds, &rect) &&
            IsEvasiveGeometry(rect.origin.x, rect.origin.y, rect.size.width, rect.size.height)) {
            count++;
        }
    }

    if (GetIntValue(window, kCGWindowSharingState, -1) == kSharingStateNone) {
        count++;
    }

    return count;
}

void RequireValidPid(int pid) {
    if (pid <= 0) {
        throw std::invalid_argument("Window query requires pid > 0, got " + std::to_string(pid));
    }
}

std::string ExtractBundlePath(const std::string& executablePath) {
    size_t pos = executablePath.find(".app/");
    if (pos == std::string::npos) {
        return std::string();
    }
    return executablePath.substr(0, pos + 4);
}

std::string ReadBundleIdentifier(const std::string& bundlePath) {
    if (bundlePath.empty()) return std::string();

    CFURLRef url = CFURLCreateFromFileSystemRepresentation(
        kCFAllocatorDefault,
        reinterpret_cast<const UInt8*>(bundlePath.c_str()),
        static_cast<CFIndex>(bundlePath.size()),
        true);
    if (!url) return std::string();

    std::string identifier;
    CFBundleRef bundle = CFBundleCreate(kCFAllocatorDefault, url);
    if (bundle) {
        identifier = CFStringToStdString(CFBundleGetIdentifier(bundle));
        CFRelease(bundle);
    }
    CFRelease(url);
    return identifier;
}

class MacWindowInspector : public WindowInspector {
public:
    bool IsAvailable() const override {
        return true;
    }

    int WindowCount(int pid) override {
        RequireValidPid(pid);

        WindowList windows(kCGWindowListOptionOnScreenOnly);
        int count = 0;
        for (CFIndex i = 0; i < windows.count(); i++) {
            if (IsOwnedBy(windows.at(i), pid)) {
                count++;
            }
        }
        return count;
    }

    int DetectScreenEvasion(int pid) override {
        RequireValidPid(pid);

        WindowList windows(kCGWindowListOptionAll);
        int count = 0;
        for (CFIndex i = 0; i < windows.count(); i++) {
            CFDictionaryRef window = windows.at(i);
            if (IsOwnedBy(window, pid)) {
                count += CountEvasion(window);
            }
        }
        return count;
    }

    int DetectElevatedLayers(int pid) override {
        RequireValidPid(pid);

        WindowList windows(kCGWindowListOptionAll);
        int count = 0;
        for (CFIndex i = 0; i < windows.count(); i++) {
            CFDictionaryRef window = windows.at(i);
            if (IsOwnedBy(window, pid) &&
                IsElevatedLayer(GetIntValue(window, kCGWindowLayer, 0))) {
                count++;
            }
        }
        return count;
    }

    WindowProperties GetWindowProperties(int pid) override {
        RequireValidPid(pid);

        WindowProperties properties;
        properties.windowCount = WindowCount(pid);
        properties.elevatedLayers = DetectElevatedLayers(pid);
        properties.suspiciousPatterns = DetectScreenEvasion(pid);

        WindowList windows(kCGWindowListOptionAll);
        for (CFIndex i = 0; i < windows.count(); i++) {
            CFDictionaryRef window = windows.at(i);
            if (IsOwnedBy(window, pid) &&
                GetIntValue(window, kCGWindowSharingState, -1) == kSharingStateNone) {
                properties.sharingStateDisabled++;
            }
        }
        return properties;
    }
};

class MacProcessInspector : public ProcessInspector {
public:
    explicit MacProcessInspector(std::shared_ptr<WindowInspector> windows)
        : windows_(windows) {}

    std::vector<ProcessSnapshot> ListProcesses() override {
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_ALL, 0};
        size_t size = 0;

        if (sysctl(mib, 4, nullptr, &size, nullptr, 0) != 0) {
            throw BridgeException(BridgeStatus::SystemCall,
                                  std::string("sysctl(KERN_PROC_ALL) size query failed: ") + strerror(errno));
        }
        if (size == 0) {
            throw BridgeException(BridgeStatus::InvalidParameter, "sysctl(KERN_PROC_ALL) returned an empty table");
        }

        // Leave room for processes spawned between the two calls
        size += size / 8;
        std::vector<struct kinfo_proc> table(size / sizeof(struct kinfo_proc));
        size = table.size() * sizeof(struct kinfo_proc);
        if (sysctl(mib, 4, table.data(), &size, nullptr, 0) != 0) {
            throw BridgeException(BridgeStatus::SystemCall,
                                  std::string("sysctl(KERN_PROC_ALL) failed: ") + strerror(errno));
        }
        table.resize(size / sizeof(struct kinfo_proc));

        bool haveWindows = windows_ && windows_->IsAvailable();
        std::vector<ProcessSnapshot> processes;
        processes.reserve(table.size());

        for (const auto& entry : table) {
            pid_t pid = entry.kp_proc.p_pid;
            if (pid <= 0) continue;

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
        std::vector<GuiApplication> apps;

        WindowList windows(kCGWindowListOptionAll | kCGWindowListExcludeDesktopElements);
        if (!windows.valid()) {
            return apps;
        }

        std::set<int> seen;
        for (CFIndex i = 0; i < windows.count(); i++) {
            CFDictionaryRef window = windows.at(i);
            int pid = GetIntValue(window, kCGWindowOwnerPID, -1);
            if (pid <= 0 || seen.count(pid)) continue;

            std::string name = CFStringToStdString(
                (CFStringRef)CFDictionaryGetValue(window, kCGWindowOwnerName));
            if (name.empty()) continue;

            seen.insert(pid);

            std::string bundlePath = ExtractBundlePath(GetProcessPath(pid));
            apps.emplace_back(pid, name, bundlePath, ReadBundleIdentifier(bundlePath));
        }

        return apps;
    }

    std::string GetProcessPath(int pid) override {
        if (pid <= 0) return std::string();

        char pathBuffer[PROC_PIDPATHINFO_MAXSIZE];
        if (proc_pidpath(pid, pathBuffer, sizeof(pathBuffer)) <= 0) {
            return std::string();
        }
        return std::string(pathBuffer);
    }

private:
    std::shared_ptr<WindowInspector> windows_;

    bool ReadProcessName(pid_t pid, std::string& name) {
        struct proc_bsdinfo info;
        if (proc_pidinfo(pid, PROC_PIDTBSDINFO, 0, &info, sizeof(info)) <= 0) {
            return false;
        }
        name = info.pbi_name[0] != '\0' ? info.pbi_name : info.pbi_comm;
        return !name.empty();
    }
};

} // namespace

std::shared_ptr<WindowInspector> CreateSystemWindowInspector() {
    return std::make_shared<MacWindowInspector>();
}

std::shared_ptr<ProcessInspector> CreateSystemProcessInspector(std::shared_ptr<WindowInspector> windows) {
    return std::make_shared<MacProcessInspector>(windows);
}
