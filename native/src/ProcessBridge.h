#ifndef PROCESS_BRIDGE_H
#define PROCESS_BRIDGE_H

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "CommonTypes.h"

// Windows at or below this compositing layer are normal application windows
const int kNormalWindowLayer = 2;

// Raised when the OS process table itself cannot be read
class BridgeException : public std::runtime_error {
public:
    BridgeException(BridgeStatus status, const std::string& msg)
        : std::runtime_error(msg), status_(status) {}

    BridgeStatus status() const { return status_; }

private:
    BridgeStatus status_;
};

// Read-only queries against the window compositor's registry.
// A pid with no windows yields zero counts; a pid <= 0 throws std::invalid_argument.
class WindowInspector {
public:
    virtual ~WindowInspector() {}

    // False where the OS has no compositor registry to query
    virtual bool IsAvailable() const = 0;

    virtual int WindowCount(int pid) = 0;
    virtual int DetectScreenEvasion(int pid) = 0;
    virtual int DetectElevatedLayers(int pid) = 0;
    virtual WindowProperties GetWindowProperties(int pid) = 0;
};

class ProcessInspector {
public:
    virtual ~ProcessInspector() {}

    // Every visible process with pid > 0, window counters filled inline.
    // Throws BridgeException when the process table query fails.
    virtual std::vector<ProcessSnapshot> ListProcesses() = 0;

    // Running GUI applications; empty where the OS keeps no such registry
    virtual std::vector<GuiApplication> ListGuiApplications() = 0;

    // Executable path for pid, empty string when unavailable
    virtual std::string GetProcessPath(int pid) = 0;
};

// Window geometry/flag predicates shared by the platform bridges
bool IsEvasiveGeometry(double x, double y, double width, double height);
bool IsElevatedLayer(int layer);

std::shared_ptr<WindowInspector> CreateSystemWindowInspector();
std::shared_ptr<ProcessInspector> CreateSystemProcessInspector(std::shared_ptr<WindowInspector> windows);

#endif // PROCESS_BRIDGE_H
