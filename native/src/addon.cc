#include <napi.h>

#include <chrono>
#include <iostream>
#include <memory>

#include "ConnectionSnapshot.h"
#include "DetectionJson.h"
#include "FileHasher.h"
#include "MonitorConfig.h"
#include "NetworkMonitor.h"
#include "ProcessBridge.h"
#include "ProcessMonitor.h"
#include "SuspiciousProcessDetector.h"

static MonitorConfig monitor_config;
static ProcessMonitor* process_monitor_instance = nullptr;
static Napi::ThreadSafeFunction monitor_tsfn;
static Napi::FunctionReference monitor_callback;

// Helpers

static std::vector<std::string> ReadStringArray(const Napi::Value& value) {
    std::vector<std::string> strings;
    if (!value.IsArray()) {
        return strings;
    }

    Napi::Array array = value.As<Napi::Array>();
    for (uint32_t i = 0; i < array.Length(); i++) {
        Napi::Value item = array.Get(i);
        if (item.IsString()) {
            strings.push_back(item.As<Napi::String>().Utf8Value());
        }
    }
    return strings;
}

static int ReadInt(const Napi::Object& options, const char* key, int fallback) {
    if (options.Has(key) && options.Get(key).IsNumber()) {
        return options.Get(key).As<Napi::Number>().Int32Value();
    }
    return fallback;
}

static Napi::Array ToJsStringArray(Napi::Env env, const std::vector<std::string>& values) {
    Napi::Array array = Napi::Array::New(env, values.size());
    for (size_t i = 0; i < values.size(); i++) {
        array[i] = Napi::String::New(env, values[i]);
    }
    return array;
}

static Napi::Object ToJsObject(Napi::Env env, const SuspiciousProcessResult& result) {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("type", Napi::String::New(env, ToString(result.type)));
    obj.Set("processName", Napi::String::New(env, result.processName));
    obj.Set("processPath", Napi::String::New(env, result.processPath));
    obj.Set("pid", Napi::Number::New(env, result.pid));
    obj.Set("message", Napi::String::New(env, result.message));
    return obj;
}

static Napi::Object ToJsObject(Napi::Env env, const AdvancedDetectionResult& result) {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("confidence", Napi::String::New(env, ToString(result.confidence)));
    obj.Set("type", Napi::String::New(env, ToString(result.type)));
    obj.Set("processName", Napi::String::New(env, result.processName));
    obj.Set("processPath", Napi::String::New(env, result.processPath));
    obj.Set("pid", Napi::Number::New(env, result.pid));
    obj.Set("message", Napi::String::New(env, result.message));
    obj.Set("evidence", ToJsStringArray(env, result.evidence));
    return obj;
}

static Napi::Object ToJsObject(Napi::Env env, const NetworkDetectionResult& result) {
    Napi::Object obj = Napi::Object::New(env);
    obj.Set("timestamp", Napi::Number::New(env, static_cast<double>(ToEpochMillis(result.timestamp))));
    obj.Set("processName", Napi::String::New(env, result.processName));
    obj.Set("processPath", Napi::String::New(env, result.processPath));
    obj.Set("pid", Napi::Number::New(env, result.pid));
    obj.Set("destinationDomain", Napi::String::New(env, result.destinationDomain));
    obj.Set("destinationPort", Napi::Number::New(env, result.destinationPort));
    obj.Set("protocol", Napi::String::New(env, result.connectionProtocol));
    obj.Set("confidence", Napi::String::New(env, ToString(result.confidence)));
    obj.Set("message", Napi::String::New(env, result.message));
    obj.Set("evidence", ToJsStringArray(env, result.evidence));
    return obj;
}

template <typename T>
static Napi::Array ToJsArray(Napi::Env env, const std::vector<T>& items) {
    Napi::Array array = Napi::Array::New(env, items.size());
    for (size_t i = 0; i < items.size(); i++) {
        array[i] = ToJsObject(env, items[i]);
    }
    return array;
}

// One-shot scans use their own detector over the live system
static std::unique_ptr<SuspiciousProcessDetector> CreateConfiguredDetector() {
    std::shared_ptr<WindowInspector> windows = CreateSystemWindowInspector();
    std::unique_ptr<SuspiciousProcessDetector> detector(
        new SuspiciousProcessDetector(CreateSystemProcessInspector(windows), windows));
    detector->Configure(monitor_config.suspiciousNames, monitor_config.suspiciousPaths,
                       monitor_config.suspiciousHashes);
    detector->ConfigureAdvancedDetection(monitor_config.enableAdvancedDetection,
                                        monitor_config.windowThreshold,
                                        monitor_config.screenEvasionThreshold);
    return detector;
}

// Configuration

Napi::Value Configure(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    if (info.Length() < 1 || !info[0].IsArray()) {
        Napi::TypeError::New(env, "Forbidden app array expected").ThrowAsJavaScriptException();
        return env.Null();
    }

    monitor_config.forbiddenApps = ReadStringArray(info[0]);

    if (info.Length() >= 2 && info[1].IsObject()) {
        Napi::Object options = info[1].As<Napi::Object>();
        if (options.Has("planType") && options.Get("planType").IsString()) {
            monitor_config.planType = ParsePlanType(options.Get("planType").As<Napi::String>().Utf8Value());
        }
    }
    monitor_config.Normalize();

    std::cout << "[vigil] Configured " << monitor_config.forbiddenApps.size() << " forbidden apps for "
              << ToString(monitor_config.planType) << " plan" << std::endl;
    return env.Null();
}

Napi::Value ConfigureSuspiciousProcesses(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    if (info.Length() < 1 || !info[0].IsObject()) {
        Napi::TypeError::New(env, "Options object expected").ThrowAsJavaScriptException();
        return env.Null();
    }

    Napi::Object options = info[0].As<Napi::Object>();
    monitor_config.suspiciousNames = ReadStringArray(options.Get("processNames"));
    monitor_config.suspiciousPaths = ReadStringArray(options.Get("paths"));
    monitor_config.suspiciousHashes = ReadStringArray(options.Get("hashes"));

    return env.Null();
}

Napi::Value EnableAdvancedDetection(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    monitor_config.enableAdvancedDetection = true;
    if (info.Length() >= 1 && info[0].IsObject()) {
        Napi::Object options = info[0].As<Napi::Object>();
        monitor_config.windowThreshold = ReadInt(options, "windowThreshold", monitor_config.windowThreshold);
        monitor_config.screenEvasionThreshold =
            ReadInt(options, "screenEvasionThreshold", monitor_config.screenEvasionThreshold);
    }

    return env.Null();
}

Napi::Value DisableAdvancedDetection(const Napi::CallbackInfo& info) {
    monitor_config.enableAdvancedDetection = false;
    return info.Env().Null();
}

// Monitoring

Napi::Value StartMonitoring(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    if (info.Length() < 1 || !info[0].IsFunction()) {
        Napi::TypeError::New(env, "Callback function expected").ThrowAsJavaScriptException();
        return env.Null();
    }

    if (process_monitor_instance && process_monitor_instance->IsMonitoring()) {
        return Napi::Boolean::New(env, false); // Already running
    }

    if (info.Length() >= 2 && info[1].IsObject()) {
        Napi::Object options = info[1].As<Napi::Object>();
        monitor_config.basicIntervalMs = ReadInt(options, "basicIntervalMs", monitor_config.basicIntervalMs);
        monitor_config.advancedIntervalMs = ReadInt(options, "advancedIntervalMs", monitor_config.advancedIntervalMs);
        monitor_config.networkIntervalMs = ReadInt(options, "networkIntervalMs", monitor_config.networkIntervalMs);
        monitor_config.utilityTimeoutMs = ReadInt(options, "utilityTimeoutMs", monitor_config.utilityTimeoutMs);
        monitor_config.dnsTimeoutMs = ReadInt(options, "dnsTimeoutMs", monitor_config.dnsTimeoutMs);
    }
    monitor_config.Normalize();

    try {
        // Timeouts of the external utility and resolver are fixed when the monitor is first created
        if (!process_monitor_instance) {
            process_monitor_instance = new ProcessMonitor(
                CreateSystemDependencies(monitor_config.utilityTimeoutMs, monitor_config.dnsTimeoutMs));
        }
        process_monitor_instance->Configure(monitor_config);

        Napi::Function callback = info[0].As<Napi::Function>();
        monitor_callback = Napi::Persistent(callback);
        monitor_tsfn = Napi::ThreadSafeFunction::New(
            env,
            callback,
            "ProcessMonitor",
            0,
            1);

        Napi::ThreadSafeFunction tsfn = monitor_tsfn;
        process_monitor_instance->SetDispatcher([tsfn](std::function<void()> step) {
            napi_status status = tsfn.NonBlockingCall([step](Napi::Env, Napi::Function) {
                step();
            });
            if (status != napi_ok) {
                std::cerr << "[vigil] Failed to queue publish (status " << status << ")" << std::endl;
            }
        });

        // Runs on the JS thread inside a dispatched publish
        process_monitor_instance->SetListener([](MonitorEvent event, const MonitorSnapshot& snapshot) {
            if (monitor_callback.IsEmpty()) {
                return;
            }
            Napi::Env callbackEnv = monitor_callback.Env();
            int64_t now = ToEpochMillis(std::chrono::system_clock::now());
            monitor_callback.Call({Napi::String::New(callbackEnv, CreateEventJson(event, snapshot, now))});
        });

        bool started = process_monitor_instance->StartMonitoring();
        return Napi::Boolean::New(env, started);
    } catch (const std::exception& e) {
        Napi::Error::New(env, std::string("Error starting monitoring: ") + e.what()).ThrowAsJavaScriptException();
        return env.Null();
    }
}

Napi::Value StopMonitoring(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    if (process_monitor_instance && process_monitor_instance->IsMonitoring()) {
        process_monitor_instance->StopMonitoring();

        if (monitor_tsfn) {
            monitor_tsfn.Release();
            monitor_tsfn = Napi::ThreadSafeFunction();
        }
        monitor_callback.Reset();
    }

    return env.Null();
}

Napi::Value IsMonitoring(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();
    bool active = process_monitor_instance && process_monitor_instance->IsMonitoring();
    return Napi::Boolean::New(env, active);
}

Napi::Value GetSnapshot(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    MonitorSnapshot snapshot;
    if (process_monitor_instance) {
        snapshot = process_monitor_instance->GetSnapshot();
    }

    Napi::Object result = Napi::Object::New(env);
    result.Set("forbiddenApps", ToJsStringArray(env, snapshot.forbiddenApps));
    result.Set("suspiciousProcesses", ToJsArray(env, snapshot.suspiciousProcesses));
    result.Set("advancedDetections", ToJsArray(env, snapshot.advancedDetections));
    result.Set("networkDetections", ToJsArray(env, snapshot.networkDetections));
    return result;
}

// One-shot diagnostics

Napi::Value ListProcesses(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    try {
        std::shared_ptr<WindowInspector> windows = CreateSystemWindowInspector();
        std::vector<ProcessSnapshot> processes = CreateSystemProcessInspector(windows)->ListProcesses();

        Napi::Array result = Napi::Array::New(env, processes.size());
        for (size_t i = 0; i < processes.size(); i++) {
            Napi::Object processObj = Napi::Object::New(env);
            processObj.Set("pid", Napi::Number::New(env, processes[i].pid));
            processObj.Set("name", Napi::String::New(env, processes[i].name));
            processObj.Set("path", Napi::String::New(env, processes[i].path));
            processObj.Set("windowCount", Napi::Number::New(env, processes[i].windowCount));
            processObj.Set("suspiciousWindowCount", Napi::Number::New(env, processes[i].suspiciousWindowCount));
            processObj.Set("screenEvasionCount", Napi::Number::New(env, processes[i].screenEvasionCount));
            processObj.Set("elevatedLayerCount", Napi::Number::New(env, processes[i].elevatedLayerCount));
            result[i] = processObj;
        }
        return result;
    } catch (const std::exception& e) {
        Napi::Error::New(env, std::string("Error listing processes: ") + e.what()).ThrowAsJavaScriptException();
        return env.Null();
    }
}

Napi::Value Sha256File(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    if (info.Length() < 1 || !info[0].IsString()) {
        Napi::TypeError::New(env, "File path expected").ThrowAsJavaScriptException();
        return env.Null();
    }

    std::string path = info[0].As<Napi::String>().Utf8Value();
    std::string digest;
    HashStatus status = FileHasher::Sha256(path, digest);

    switch (status) {
        case HashStatus::Ok:
            return Napi::String::New(env, digest);
        case HashStatus::FileNotReadable:
            Napi::Error::New(env, "File not readable: " + path).ThrowAsJavaScriptException();
            return env.Null();
        case HashStatus::IOError:
            Napi::Error::New(env, "I/O error while hashing: " + path).ThrowAsJavaScriptException();
            return env.Null();
    }
    return env.Null();
}

Napi::Value AnalyzeDestination(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    if (info.Length() < 2 || !info[0].IsString() || !info[1].IsNumber()) {
        Napi::TypeError::New(env, "Host string and port number expected").ThrowAsJavaScriptException();
        return env.Null();
    }

    std::string host = info[0].As<Napi::String>().Utf8Value();
    int port = info[1].As<Napi::Number>().Int32Value();
    DestinationAnalysis analysis = NetworkMonitor::AnalyzeDestination(host, port);

    Napi::Object result = Napi::Object::New(env);
    result.Set("confidence", Napi::String::New(env, ToString(analysis.confidence)));
    result.Set("evidence", ToJsStringArray(env, analysis.evidence));
    return result;
}

Napi::Value ParseConnectionLineJs(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    if (info.Length() < 1 || !info[0].IsString()) {
        Napi::TypeError::New(env, "Connection line expected").ThrowAsJavaScriptException();
        return env.Null();
    }

    ParsedConnection connection;
    if (!ParseConnectionLine(info[0].As<Napi::String>().Utf8Value(), connection)) {
        return env.Null();
    }

    Napi::Object result = Napi::Object::New(env);
    result.Set("processName", Napi::String::New(env, connection.processName));
    result.Set("pid", Napi::Number::New(env, connection.pid));
    result.Set("remoteHost", Napi::String::New(env, connection.remoteHost));
    result.Set("remotePort", Napi::Number::New(env, connection.remotePort));
    return result;
}

Napi::Value DetectSuspiciousProcesses(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    try {
        std::unique_ptr<SuspiciousProcessDetector> detector = CreateConfiguredDetector();
        BasicScanResult scan = detector->DetectSuspiciousProcesses(AlertState());
        return ToJsArray(env, scan.results);
    } catch (const std::exception& e) {
        Napi::Error::New(env, std::string("Error detecting suspicious processes: ") + e.what()).ThrowAsJavaScriptException();
        return env.Null();
    }
}

Napi::Value DetectAdvancedSuspiciousProcesses(const Napi::CallbackInfo& info) {
    Napi::Env env = info.Env();

    try {
        std::unique_ptr<SuspiciousProcessDetector> detector = CreateConfiguredDetector();
        return ToJsArray(env, detector->DetectAdvancedSuspiciousProcesses());
    } catch (const std::exception& e) {
        Napi::Error::New(env, std::string("Error running advanced detection: ") + e.what()).ThrowAsJavaScriptException();
        return env.Null();
    }
}

Napi::Object Init(Napi::Env env, Napi::Object exports) {
    exports.Set(Napi::String::New(env, "configure"), Napi::Function::New(env, Configure));
    exports.Set(Napi::String::New(env, "configureSuspiciousProcesses"), Napi::Function::New(env, ConfigureSuspiciousProcesses));
    exports.Set(Napi::String::New(env, "enableAdvancedDetection"), Napi::Function::New(env, EnableAdvancedDetection));
    exports.Set(Napi::String::New(env, "disableAdvancedDetection"), Napi::Function::New(env, DisableAdvancedDetection));

    exports.Set(Napi::String::New(env, "startMonitoring"), Napi::Function::New(env, StartMonitoring));
    exports.Set(Napi::String::New(env, "stopMonitoring"), Napi::Function::New(env, StopMonitoring));
    exports.Set(Napi::String::New(env, "isMonitoring"), Napi::Function::New(env, IsMonitoring));
    exports.Set(Napi::String::New(env, "getSnapshot"), Napi::Function::New(env, GetSnapshot));

    exports.Set(Napi::String::New(env, "listProcesses"), Napi::Function::New(env, ListProcesses));
    exports.Set(Napi::String::New(env, "sha256File"), Napi::Function::New(env, Sha256File));
    exports.Set(Napi::String::New(env, "analyzeDestination"), Napi::Function::New(env, AnalyzeDestination));
    exports.Set(Napi::String::New(env, "parseConnectionLine"), Napi::Function::New(env, ParseConnectionLineJs));
    exports.Set(Napi::String::New(env, "detectSuspiciousProcesses"), Napi::Function::New(env, DetectSuspiciousProcesses));
    exports.Set(Napi::String::New(env, "detectAdvancedSuspiciousProcesses"), Napi::Function::New(env, DetectAdvancedSuspiciousProcesses));

    return exports;
}

NODE_API_MODULE(vigil_native, Init)
