#pragma once

#include <surge/config/config_helpers.h>
#include <surge/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace surge::config {

enum class DeadWorkerPolicy { Fail, Degrade };
enum class LoadMode { Concurrency, FindMax };

const char* toString(DeadWorkerPolicy policy);
const char* toString(LoadMode mode);

struct StoreSettings {
    std::string path;
    std::chrono::milliseconds busyTimeout{5000};
};

struct LoggingSettings {
    std::string level{"info"};
    std::string file;
};

struct RendezvousSettings {
    std::chrono::milliseconds pollInterval{100};
    std::chrono::milliseconds timeout{60000};
};

struct HeartbeatSettings {
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds staleTimeout{10000};
};

struct OrchestratorSettings {
    int workerGroupSize{1};
    int minWorkers{1};
    DeadWorkerPolicy deadWorkerPolicy{DeadWorkerPolicy::Fail};
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds rendezvousTimeout{120000};
    std::chrono::milliseconds drainTimeout{120000};
    int perWorkerCap{0}; ///< 0 = split the total evenly
};

/// Percentages of each operation kind; they need not sum to 100.
struct OperationMix {
    double pointLookupPct{100.0};
    double rangeScanPct{0.0};
    double insertPct{0.0};
    double updatePct{0.0};
};

struct WorkloadSettings {
    LoadMode loadMode{LoadMode::Concurrency};
    int concurrency{10};
    double warmupSeconds{0.0};
    double durationSeconds{60.0};
    std::chrono::milliseconds thinkTime{0};
    int64_t operationsPerTask{0}; ///< 0 = unbounded
    OperationMix mix;
};

/// Per operation kind latency / error bounds. Unset bounds are not checked.
struct KindSlo {
    std::optional<double> p95Ms;
    std::optional<double> p99Ms;
    std::optional<double> errorRatePct;
};

struct FindMaxSettings {
    int startConcurrency{5};
    int concurrencyIncrement{10};
    std::chrono::milliseconds stepDuration{30000};
    int maxConcurrency{100};
    double latencyStabilityPct{20.0};
    double maxErrorRatePct{1.0};
    double qpsStabilityPct{0.0};  ///< 0 disables the QPS-drop check
    int maxBackoffAttempts{0};    ///< 0 disables backoff and midpoint probing
    std::chrono::milliseconds settleDelay{500};
    std::map<std::string, KindSlo> slo; ///< keyed by operation kind name, e.g. POINT_LOOKUP
};

/// Knobs of the built-in simulated target.
struct TargetSettings {
    double baseLatencyMs{5.0};
    double latencyPerInflightMs{0.2};
    double jitterPct{10.0};
    double errorRatePct{0.0};
    int connectionLimit{0}; ///< 0 = unlimited
};

struct Settings {
    StoreSettings store;
    LoggingSettings logging;
    RendezvousSettings rendezvous;
    HeartbeatSettings heartbeat;
    OrchestratorSettings orchestrator;
    WorkloadSettings workload;
    FindMaxSettings findMax;
    TargetSettings target;
};

/// Maps parsed config sections onto Settings, starting from defaults.
/// Unparseable values are reported as ErrorCode::InvalidArgument.
Result<Settings> settingsFromSections(const ConfigSections& sections);

/// Resolves the config file (explicit path, then $SURGE_CONFIG, then the XDG
/// location), parses it if present and applies environment overrides. An
/// explicitly requested file that does not exist is an error; a missing
/// default file yields defaults.
Result<Settings> loadSettings(const std::string& explicitPath = "");

/// SURGE_STORE_PATH and SURGE_LOG_LEVEL.
void applyEnvironmentOverrides(Settings& settings);

/// Rejects combinations the runtime cannot execute.
Result<void> validate(const Settings& settings);

} // namespace surge::config
