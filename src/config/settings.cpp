#include <surge/config/settings.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace surge::config {

namespace {

constexpr std::string_view kSloPrefix = "find_max.slo.";

const std::string* lookup(const ConfigSections& sections, const std::string& section,
                          const std::string& key) {
    auto sit = sections.find(section);
    if (sit == sections.end())
        return nullptr;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end())
        return nullptr;
    return &kit->second;
}

Error badValue(const std::string& section, const std::string& key, const std::string& raw) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for [" + section + "] " + key + ": '" + raw + "'"};
}

Result<void> readInt64(const ConfigSections& s, const std::string& section, const std::string& key,
                       int64_t& out) {
    const auto* raw = lookup(s, section, key);
    if (!raw)
        return {};
    try {
        size_t pos = 0;
        auto v = std::stoll(*raw, &pos);
        if (pos != raw->size())
            return badValue(section, key, *raw);
        out = v;
    } catch (const std::exception&) {
        return badValue(section, key, *raw);
    }
    return {};
}

Result<void> readInt(const ConfigSections& s, const std::string& section, const std::string& key,
                     int& out) {
    int64_t v = out;
    auto r = readInt64(s, section, key, v);
    if (!r)
        return r;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return badValue(section, key, *lookup(s, section, key));
    out = static_cast<int>(v);
    return {};
}

Result<void> readDouble(const ConfigSections& s, const std::string& section,
                        const std::string& key, double& out) {
    const auto* raw = lookup(s, section, key);
    if (!raw)
        return {};
    try {
        size_t pos = 0;
        auto v = std::stod(*raw, &pos);
        if (pos != raw->size())
            return badValue(section, key, *raw);
        out = v;
    } catch (const std::exception&) {
        return badValue(section, key, *raw);
    }
    return {};
}

Result<void> readOptionalDouble(const ConfigSections& s, const std::string& section,
                                const std::string& key, std::optional<double>& out) {
    if (!lookup(s, section, key))
        return {};
    double v = 0.0;
    auto r = readDouble(s, section, key, v);
    if (!r)
        return r;
    out = v;
    return {};
}

Result<void> readMillis(const ConfigSections& s, const std::string& section,
                        const std::string& key, std::chrono::milliseconds& out) {
    int64_t v = out.count();
    auto r = readInt64(s, section, key, v);
    if (!r)
        return r;
    out = std::chrono::milliseconds(v);
    return {};
}

void readString(const ConfigSections& s, const std::string& section, const std::string& key,
                std::string& out) {
    if (const auto* raw = lookup(s, section, key))
        out = *raw;
}

std::string upperKind(std::string_view name) {
    std::string out(name);
    for (auto& c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

} // namespace

const char* toString(DeadWorkerPolicy policy) {
    return policy == DeadWorkerPolicy::Degrade ? "degrade" : "fail";
}

const char* toString(LoadMode mode) {
    return mode == LoadMode::FindMax ? "find_max" : "concurrency";
}

Result<Settings> settingsFromSections(const ConfigSections& sections) {
    Settings settings;
    Result<void> status;
    auto check = [&status](Result<void> r) {
        if (status && !r)
            status = std::move(r);
    };

    readString(sections, "store", "path", settings.store.path);
    check(readMillis(sections, "store", "busy_timeout_ms", settings.store.busyTimeout));

    readString(sections, "logging", "level", settings.logging.level);
    readString(sections, "logging", "file", settings.logging.file);

    check(readMillis(sections, "rendezvous", "poll_interval_ms",
                     settings.rendezvous.pollInterval));
    check(readMillis(sections, "rendezvous", "timeout_ms", settings.rendezvous.timeout));

    check(readMillis(sections, "heartbeat", "interval_ms", settings.heartbeat.interval));
    check(readMillis(sections, "heartbeat", "stale_timeout_ms", settings.heartbeat.staleTimeout));

    auto& orch = settings.orchestrator;
    check(readInt(sections, "orchestrator", "worker_group_size", orch.workerGroupSize));
    check(readInt(sections, "orchestrator", "min_workers", orch.minWorkers));
    if (const auto* policy = lookup(sections, "orchestrator", "dead_worker_policy")) {
        if (*policy == "fail") {
            orch.deadWorkerPolicy = DeadWorkerPolicy::Fail;
        } else if (*policy == "degrade") {
            orch.deadWorkerPolicy = DeadWorkerPolicy::Degrade;
        } else {
            check(badValue("orchestrator", "dead_worker_policy", *policy));
        }
    }
    check(readMillis(sections, "orchestrator", "poll_interval_ms", orch.pollInterval));
    check(readMillis(sections, "orchestrator", "rendezvous_timeout_ms", orch.rendezvousTimeout));
    check(readMillis(sections, "orchestrator", "drain_timeout_ms", orch.drainTimeout));
    check(readInt(sections, "orchestrator", "per_worker_cap", orch.perWorkerCap));

    auto& wl = settings.workload;
    if (const auto* mode = lookup(sections, "workload", "load_mode")) {
        if (*mode == "concurrency") {
            wl.loadMode = LoadMode::Concurrency;
        } else if (*mode == "find_max") {
            wl.loadMode = LoadMode::FindMax;
        } else {
            check(badValue("workload", "load_mode", *mode));
        }
    }
    check(readInt(sections, "workload", "concurrency", wl.concurrency));
    check(readDouble(sections, "workload", "warmup_seconds", wl.warmupSeconds));
    check(readDouble(sections, "workload", "duration_seconds", wl.durationSeconds));
    check(readMillis(sections, "workload", "think_time_ms", wl.thinkTime));
    check(readInt64(sections, "workload", "operations_per_task", wl.operationsPerTask));
    check(readDouble(sections, "workload", "point_lookup_pct", wl.mix.pointLookupPct));
    check(readDouble(sections, "workload", "range_scan_pct", wl.mix.rangeScanPct));
    check(readDouble(sections, "workload", "insert_pct", wl.mix.insertPct));
    check(readDouble(sections, "workload", "update_pct", wl.mix.updatePct));

    auto& fm = settings.findMax;
    check(readInt(sections, "find_max", "start_concurrency", fm.startConcurrency));
    check(readInt(sections, "find_max", "concurrency_increment", fm.concurrencyIncrement));
    check(readMillis(sections, "find_max", "step_duration_ms", fm.stepDuration));
    check(readInt(sections, "find_max", "max_concurrency", fm.maxConcurrency));
    check(readDouble(sections, "find_max", "latency_stability_pct", fm.latencyStabilityPct));
    check(readDouble(sections, "find_max", "max_error_rate_pct", fm.maxErrorRatePct));
    check(readDouble(sections, "find_max", "qps_stability_pct", fm.qpsStabilityPct));
    check(readInt(sections, "find_max", "max_backoff_attempts", fm.maxBackoffAttempts));
    check(readMillis(sections, "find_max", "settle_delay_ms", fm.settleDelay));
    for (const auto& [name, _] : sections) {
        if (name.size() <= kSloPrefix.size() || name.compare(0, kSloPrefix.size(), kSloPrefix) != 0)
            continue;
        KindSlo slo;
        check(readOptionalDouble(sections, name, "p95_ms", slo.p95Ms));
        check(readOptionalDouble(sections, name, "p99_ms", slo.p99Ms));
        check(readOptionalDouble(sections, name, "error_rate_pct", slo.errorRatePct));
        fm.slo[upperKind(std::string_view(name).substr(kSloPrefix.size()))] = slo;
    }

    auto& tg = settings.target;
    check(readDouble(sections, "target", "base_latency_ms", tg.baseLatencyMs));
    check(readDouble(sections, "target", "latency_per_inflight_ms", tg.latencyPerInflightMs));
    check(readDouble(sections, "target", "jitter_pct", tg.jitterPct));
    check(readDouble(sections, "target", "error_rate_pct", tg.errorRatePct));
    check(readInt(sections, "target", "connection_limit", tg.connectionLimit));

    if (!status)
        return status.error();
    return settings;
}

void applyEnvironmentOverrides(Settings& settings) {
    if (const char* storePath = std::getenv("SURGE_STORE_PATH"); storePath && *storePath) {
        settings.store.path = storePath;
    }
    if (const char* level = std::getenv("SURGE_LOG_LEVEL"); level && *level) {
        settings.logging.level = level;
    }
}

Result<Settings> loadSettings(const std::string& explicitPath) {
    std::string requested = explicitPath;
    if (requested.empty()) {
        if (const char* env = std::getenv("SURGE_CONFIG"); env && *env) {
            requested = env;
        }
    }

    ConfigSections sections;
    const auto configPath = resolveConfigPath(requested);
    if (std::filesystem::exists(configPath)) {
        auto parsed = parseConfigFile(configPath);
        if (!parsed)
            return parsed.error();
        sections = std::move(parsed).value();
        spdlog::debug("[Config] Loaded {}", configPath.string());
    } else if (!requested.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + configPath.string()};
    }

    auto settings = settingsFromSections(sections);
    if (!settings)
        return settings;

    Settings out = std::move(settings).value();
    applyEnvironmentOverrides(out);
    if (out.store.path.empty()) {
        out.store.path = (defaultDataDir() / "surge.db").string();
    } else {
        out.store.path = expandHome(out.store.path).string();
    }
    return out;
}

Result<void> validate(const Settings& s) {
    if (s.orchestrator.workerGroupSize < 1)
        return Error{ErrorCode::InvalidArgument, "worker_group_size must be >= 1"};
    if (s.orchestrator.minWorkers < 1 || s.orchestrator.minWorkers > s.orchestrator.workerGroupSize)
        return Error{ErrorCode::InvalidArgument, "min_workers must be in [1, worker_group_size]"};
    if (s.workload.concurrency < 0)
        return Error{ErrorCode::InvalidArgument, "concurrency must be >= 0"};
    if (s.findMax.startConcurrency < 1)
        return Error{ErrorCode::InvalidArgument, "start_concurrency must be >= 1"};
    if (s.findMax.concurrencyIncrement < 1)
        return Error{ErrorCode::InvalidArgument, "concurrency_increment must be >= 1"};
    if (s.findMax.maxConcurrency < s.findMax.startConcurrency)
        return Error{ErrorCode::InvalidArgument, "max_concurrency must be >= start_concurrency"};
    if (s.findMax.stepDuration.count() <= 0)
        return Error{ErrorCode::InvalidArgument, "step_duration_ms must be > 0"};
    const auto& mix = s.workload.mix;
    if (mix.pointLookupPct < 0 || mix.rangeScanPct < 0 || mix.insertPct < 0 || mix.updatePct < 0 ||
        mix.pointLookupPct + mix.rangeScanPct + mix.insertPct + mix.updatePct <= 0) {
        return Error{ErrorCode::InvalidArgument, "operation mix must have a positive weight"};
    }
    if (s.heartbeat.interval.count() <= 0 || s.rendezvous.pollInterval.count() <= 0 ||
        s.orchestrator.pollInterval.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "poll and heartbeat intervals must be > 0"};
    }
    if (s.heartbeat.staleTimeout <= s.heartbeat.interval)
        return Error{ErrorCode::InvalidArgument,
                     "heartbeat stale_timeout_ms must be greater than interval_ms"};
    return {};
}

} // namespace surge::config
