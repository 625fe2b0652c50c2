#include <surge/store/record_json.h>
#include <surge/store/sqlite_state_store.h>

#include <spdlog/spdlog.h>

namespace surge::store {

using control::ControlEvent;
using control::ControlPayload;

namespace {

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS run_status (
    run_id           TEXT PRIMARY KEY,
    status           TEXT NOT NULL,
    phase            TEXT NOT NULL,
    workers_expected INTEGER NOT NULL DEFAULT 1,
    load_mode        TEXT NOT NULL DEFAULT 'concurrency',
    start_time       INTEGER,
    end_time         INTEGER,
    created_at       INTEGER NOT NULL,
    updated_at       INTEGER NOT NULL,
    message          TEXT
);

CREATE TABLE IF NOT EXISTS worker_heartbeats (
    run_id             TEXT NOT NULL,
    worker_id          TEXT NOT NULL,
    worker_group_id    INTEGER NOT NULL DEFAULT 0,
    status             TEXT NOT NULL,
    phase              TEXT,
    last_heartbeat     INTEGER NOT NULL,
    heartbeat_count    INTEGER NOT NULL DEFAULT 0,
    active_tasks       INTEGER NOT NULL DEFAULT 0,
    target_concurrency INTEGER NOT NULL DEFAULT 0,
    operations         INTEGER NOT NULL DEFAULT 0,
    errors             INTEGER NOT NULL DEFAULT 0,
    last_error         TEXT,
    PRIMARY KEY (run_id, worker_id)
);

CREATE TABLE IF NOT EXISTS control_events (
    run_id     TEXT NOT NULL,
    sequence   INTEGER NOT NULL,
    event_type TEXT NOT NULL,
    event_data TEXT NOT NULL,
    timestamp  INTEGER NOT NULL,
    PRIMARY KEY (run_id, sequence)
);

CREATE TABLE IF NOT EXISTS step_records (
    run_id           TEXT NOT NULL,
    worker_id        TEXT NOT NULL,
    step_index       INTEGER NOT NULL,
    concurrency      INTEGER NOT NULL,
    qps              REAL NOT NULL,
    p95_latency_ms   REAL NOT NULL,
    p99_latency_ms   REAL NOT NULL,
    error_rate_pct   REAL NOT NULL,
    stable           INTEGER NOT NULL,
    stop_reason      TEXT,
    is_backoff       INTEGER NOT NULL DEFAULT 0,
    operations       INTEGER NOT NULL DEFAULT 0,
    errors           INTEGER NOT NULL DEFAULT 0,
    duration_seconds REAL NOT NULL DEFAULT 0,
    kind_metrics     TEXT,
    recorded_at      INTEGER NOT NULL,
    PRIMARY KEY (run_id, worker_id, step_index)
);

CREATE TABLE IF NOT EXISTS worker_results (
    run_id            TEXT NOT NULL,
    worker_id         TEXT NOT NULL,
    worker_group_id   INTEGER NOT NULL DEFAULT 0,
    status            TEXT NOT NULL,
    message           TEXT,
    total_operations  INTEGER NOT NULL DEFAULT 0,
    failed_operations INTEGER NOT NULL DEFAULT 0,
    find_max_result   TEXT,
    reported_at       INTEGER NOT NULL,
    PRIMARY KEY (run_id, worker_id)
);

CREATE TABLE IF NOT EXISTS run_results (
    run_id            TEXT PRIMARY KEY,
    total_operations  INTEGER NOT NULL DEFAULT 0,
    failed_operations INTEGER NOT NULL DEFAULT 0,
    workers_reported  INTEGER NOT NULL DEFAULT 0,
    find_max_result   TEXT,
    completed_at      INTEGER NOT NULL
);
)";

constexpr const char* kRunColumns =
    "run_id, status, phase, workers_expected, load_mode, start_time, end_time, created_at, "
    "updated_at, message";

RunRecord readRunRow(const Statement& stmt) {
    RunRecord r;
    r.runId = stmt.getString(0);
    r.status = control::parseRunStatus(stmt.getString(1));
    r.phase = control::parseRunPhase(stmt.getString(2));
    r.workersExpected = stmt.getInt(3);
    r.loadMode = stmt.getString(4);
    r.startTimeMs = stmt.getOptionalInt64(5);
    r.endTimeMs = stmt.getOptionalInt64(6);
    r.createdAtMs = stmt.getInt64(7);
    r.updatedAtMs = stmt.getInt64(8);
    r.message = stmt.getString(9);
    return r;
}

Result<nlohmann::json> parseJsonColumn(const std::string& text, const char* column) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string(column) + " is not valid JSON: " + e.what()};
    }
}

} // namespace

Result<std::unique_ptr<SqliteStateStore>> SqliteStateStore::open(Config config) {
    if (config.path.empty()) {
        return Error{ErrorCode::InvalidArgument, "store path is empty"};
    }

    Database db;
    const auto mode = config.path == ":memory:" ? OpenMode::Memory : OpenMode::File;
    if (auto r = db.open(config.path, mode); !r) {
        return r.error();
    }
    if (auto r = db.setBusyTimeout(config.busyTimeout); !r) {
        return r.error();
    }
    if (mode != OpenMode::Memory) {
        if (auto r = db.enableWAL(); !r) {
            return r.error();
        }
    }

    std::unique_ptr<SqliteStateStore> store(new SqliteStateStore(std::move(db), config.path));
    if (auto r = store->initializeSchema(); !r) {
        return r.error();
    }
    spdlog::debug("[StateStore] Opened {} (sqlite {})", config.path, Database::version());
    return std::move(store);
}

Result<void> SqliteStateStore::initializeSchema() {
    std::scoped_lock lock(mutex_);
    return db_.execute(kSchema);
}

// ----------------------------------------------------------------------------
// run_status
// ----------------------------------------------------------------------------

Result<void> SqliteStateStore::createRun(const RunRecord& run) {
    std::scoped_lock lock(mutex_);
    auto stmtResult =
        db_.prepare("INSERT OR IGNORE INTO run_status (run_id, status, phase, workers_expected, "
                    "load_mode, start_time, end_time, created_at, updated_at, message) "
                    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    const int64_t now = epochMillis();
    const int64_t createdAt = run.createdAtMs > 0 ? run.createdAtMs : now;
    auto bindResult = stmt.bindAll(run.runId, control::toString(run.status),
                                   control::toString(run.phase), run.workersExpected, run.loadMode,
                                   run.startTimeMs, run.endTimeMs, createdAt, now, run.message);
    if (!bindResult)
        return bindResult;
    if (auto r = stmt.execute(); !r)
        return r;
    if (db_.changes() == 0) {
        return Error{ErrorCode::Conflict, "run already exists: " + run.runId};
    }
    return {};
}

Result<RunRecord> SqliteStateStore::readRun(const std::string& runId) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare(std::string("SELECT ") + kRunColumns +
                                  " FROM run_status WHERE run_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, runId); !r)
        return r.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return Error{ErrorCode::NotFound, "run not found: " + runId};
    }
    return readRunRow(stmt);
}

Result<bool> SqliteStateStore::transitionRun(const std::string& runId, const RunTransition& t) {
    std::scoped_lock lock(mutex_);
    std::string sql = "UPDATE run_status SET updated_at = ?";
    if (t.status)
        sql += ", status = ?";
    if (t.phase)
        sql += ", phase = ?";
    if (t.startTimeMs)
        sql += ", start_time = ?";
    if (t.endTimeMs)
        sql += ", end_time = ?";
    if (t.message)
        sql += ", message = ?";
    sql += " WHERE run_id = ? AND status = ?";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    int idx = 1;
    Result<void> bound = stmt.bind(idx++, epochMillis());
    if (bound && t.status)
        bound = stmt.bind(idx++, control::toString(*t.status));
    if (bound && t.phase)
        bound = stmt.bind(idx++, control::toString(*t.phase));
    if (bound && t.startTimeMs)
        bound = stmt.bind(idx++, *t.startTimeMs);
    if (bound && t.endTimeMs)
        bound = stmt.bind(idx++, *t.endTimeMs);
    if (bound && t.message)
        bound = stmt.bind(idx++, *t.message);
    if (bound)
        bound = stmt.bind(idx++, runId);
    if (bound)
        bound = stmt.bind(idx++, control::toString(t.expected));
    if (!bound)
        return bound.error();

    if (auto r = stmt.execute(); !r)
        return r.error();
    return db_.changes() > 0;
}

Result<std::vector<RunRecord>> SqliteStateStore::listRuns(int limit) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare(std::string("SELECT ") + kRunColumns +
                                  " FROM run_status ORDER BY created_at DESC LIMIT ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, limit > 0 ? limit : -1); !r)
        return r.error();

    std::vector<RunRecord> runs;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        runs.push_back(readRunRow(stmt));
    }
    return runs;
}

// ----------------------------------------------------------------------------
// worker_heartbeats
// ----------------------------------------------------------------------------

Result<void> SqliteStateStore::upsertHeartbeat(const HeartbeatRecord& hb) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare(
        "INSERT INTO worker_heartbeats (run_id, worker_id, worker_group_id, status, phase, "
        "last_heartbeat, heartbeat_count, active_tasks, target_concurrency, operations, errors, "
        "last_error) VALUES (?, ?, ?, ?, ?, ?, 1, ?, ?, ?, ?, ?) "
        "ON CONFLICT(run_id, worker_id) DO UPDATE SET "
        "worker_group_id = excluded.worker_group_id, status = excluded.status, "
        "phase = excluded.phase, last_heartbeat = excluded.last_heartbeat, "
        "heartbeat_count = worker_heartbeats.heartbeat_count + 1, "
        "active_tasks = excluded.active_tasks, target_concurrency = excluded.target_concurrency, "
        "operations = excluded.operations, errors = excluded.errors, "
        "last_error = excluded.last_error");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    const int64_t ts = hb.lastHeartbeatMs > 0 ? hb.lastHeartbeatMs : epochMillis();
    auto bindResult =
        stmt.bindAll(hb.runId, hb.workerId, hb.workerGroupId, control::toString(hb.status),
                     control::toString(hb.phase), ts, hb.activeTasks, hb.targetConcurrency,
                     hb.operations, hb.errors, hb.lastError);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<std::vector<HeartbeatRecord>> SqliteStateStore::listHeartbeats(const std::string& runId) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare(
        "SELECT worker_id, worker_group_id, status, phase, last_heartbeat, heartbeat_count, "
        "active_tasks, target_concurrency, operations, errors, last_error "
        "FROM worker_heartbeats WHERE run_id = ? ORDER BY worker_group_id, worker_id");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, runId); !r)
        return r.error();

    std::vector<HeartbeatRecord> rows;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        HeartbeatRecord hb;
        hb.runId = runId;
        hb.workerId = stmt.getString(0);
        hb.workerGroupId = stmt.getInt(1);
        auto status = control::parseWorkerStatus(stmt.getString(2));
        if (!status) {
            spdlog::warn("[StateStore] Heartbeat for {} has unknown status '{}'", hb.workerId,
                         stmt.getString(2));
            continue;
        }
        hb.status = *status;
        hb.phase = control::parseRunPhase(stmt.getString(3));
        hb.lastHeartbeatMs = stmt.getInt64(4);
        hb.heartbeatCount = stmt.getInt64(5);
        hb.activeTasks = stmt.getInt(6);
        hb.targetConcurrency = stmt.getInt(7);
        hb.operations = stmt.getInt64(8);
        hb.errors = stmt.getInt64(9);
        hb.lastError = stmt.getString(10);
        rows.push_back(std::move(hb));
    }
    return rows;
}

Result<int> SqliteStateStore::deleteHeartbeats(const std::string& runId) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare("DELETE FROM worker_heartbeats WHERE run_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, runId); !r)
        return r.error();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return db_.changes();
}

// ----------------------------------------------------------------------------
// control_events
// ----------------------------------------------------------------------------

Result<ControlEvent> SqliteStateStore::appendControlEvent(const std::string& runId,
                                                          const ControlPayload& payload) {
    std::scoped_lock lock(mutex_);
    ControlEvent event;
    event.runId = runId;
    event.payload = payload;
    event.timestampMs = epochMillis();
    const auto type = control::eventTypeOf(payload);
    const auto data = control::encodeEventData(payload);

    // Sequence assignment reads MAX(sequence) and inserts under one write lock.
    auto txResult = db_.transaction(
        [&]() -> Result<void> {
            auto selResult = db_.prepare(
                "SELECT COALESCE(MAX(sequence), 0) + 1 FROM control_events WHERE run_id = ?");
            if (!selResult)
                return selResult.error();
            auto sel = std::move(selResult).value();
            if (auto r = sel.bind(1, runId); !r)
                return r;
            auto stepResult = sel.step();
            if (!stepResult)
                return stepResult.error();
            event.sequence = stepResult.value() ? sel.getInt64(0) : 1;

            auto insResult =
                db_.prepare("INSERT INTO control_events (run_id, sequence, event_type, "
                            "event_data, timestamp) VALUES (?, ?, ?, ?, ?)");
            if (!insResult)
                return insResult.error();
            auto ins = std::move(insResult).value();
            if (auto r = ins.bindAll(runId, event.sequence, control::toString(type), data,
                                     event.timestampMs);
                !r)
                return r;
            return ins.execute();
        },
        TransactionMode::Immediate);
    if (!txResult)
        return txResult.error();
    return event;
}

Result<std::vector<ControlEvent>>
SqliteStateStore::listControlEventsAfter(const std::string& runId, int64_t afterSequence) {
    std::scoped_lock lock(mutex_);
    auto stmtResult =
        db_.prepare("SELECT sequence, event_type, event_data, timestamp FROM control_events "
                    "WHERE run_id = ? AND sequence > ? ORDER BY sequence ASC");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bindAll(runId, afterSequence); !r)
        return r.error();

    std::vector<ControlEvent> events;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        const int64_t seq = stmt.getInt64(0);
        const auto typeText = stmt.getString(1);
        auto type = control::parseControlEventType(typeText);
        if (!type) {
            spdlog::warn("[StateStore] Skipping control event {}#{} with unknown type '{}'", runId,
                         seq, typeText);
            continue;
        }
        auto payload = control::decodeEventData(*type, stmt.getString(2));
        if (!payload) {
            spdlog::warn("[StateStore] Skipping control event {}#{}: {}", runId, seq,
                         payload.error().message);
            continue;
        }
        ControlEvent event;
        event.runId = runId;
        event.sequence = seq;
        event.payload = std::move(payload).value();
        event.timestampMs = stmt.getInt64(3);
        events.push_back(std::move(event));
    }
    return events;
}

// ----------------------------------------------------------------------------
// step_records
// ----------------------------------------------------------------------------

Result<void> SqliteStateStore::appendStepRecord(const std::string& runId,
                                                const std::string& workerId,
                                                const StepRecord& step) {
    std::scoped_lock lock(mutex_);
    // Step records are immutable; replaying the same step index is a no-op.
    auto stmtResult = db_.prepare(
        "INSERT OR IGNORE INTO step_records (run_id, worker_id, step_index, concurrency, qps, "
        "p95_latency_ms, p99_latency_ms, error_rate_pct, stable, stop_reason, is_backoff, "
        "operations, errors, duration_seconds, kind_metrics, recorded_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    const nlohmann::json kinds = step.kindMetrics;
    const int64_t recordedAt = step.recordedAtMs > 0 ? step.recordedAtMs : epochMillis();
    auto bindResult =
        stmt.bindAll(runId, workerId, step.stepIndex, step.concurrency, step.qps,
                     step.p95LatencyMs, step.p99LatencyMs, step.errorRatePct, step.stable ? 1 : 0,
                     step.stopReason, step.isBackoff ? 1 : 0, step.operations, step.errors,
                     step.durationSeconds, kinds.dump(), recordedAt);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<std::vector<WorkerStepRecord>>
SqliteStateStore::listStepRecords(const std::string& runId,
                                  const std::optional<std::string>& workerId) {
    std::scoped_lock lock(mutex_);
    std::string sql =
        "SELECT worker_id, step_index, concurrency, qps, p95_latency_ms, p99_latency_ms, "
        "error_rate_pct, stable, stop_reason, is_backoff, operations, errors, duration_seconds, "
        "kind_metrics, recorded_at FROM step_records WHERE run_id = ?";
    if (workerId)
        sql += " AND worker_id = ?";
    sql += " ORDER BY worker_id, step_index";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, runId); !r)
        return r.error();
    if (workerId) {
        if (auto r = stmt.bind(2, *workerId); !r)
            return r.error();
    }

    std::vector<WorkerStepRecord> rows;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        WorkerStepRecord row;
        row.workerId = stmt.getString(0);
        auto& s = row.step;
        s.stepIndex = stmt.getInt(1);
        s.concurrency = stmt.getInt(2);
        s.qps = stmt.getDouble(3);
        s.p95LatencyMs = stmt.getDouble(4);
        s.p99LatencyMs = stmt.getDouble(5);
        s.errorRatePct = stmt.getDouble(6);
        s.stable = stmt.getInt(7) != 0;
        s.stopReason = stmt.getOptionalString(8);
        s.isBackoff = stmt.getInt(9) != 0;
        s.operations = stmt.getInt64(10);
        s.errors = stmt.getInt64(11);
        s.durationSeconds = stmt.getDouble(12);
        if (auto text = stmt.getOptionalString(13); text && !text->empty()) {
            auto parsed = parseJsonColumn(*text, "kind_metrics");
            if (!parsed)
                return parsed.error();
            try {
                s.kindMetrics = parsed.value().get<std::map<std::string, KindStepMetrics>>();
            } catch (const nlohmann::json::exception& e) {
                return Error{ErrorCode::InvalidData, std::string("kind_metrics: ") + e.what()};
            }
        }
        s.recordedAtMs = stmt.getInt64(14);
        rows.push_back(std::move(row));
    }
    return rows;
}

// ----------------------------------------------------------------------------
// worker_results / run_results
// ----------------------------------------------------------------------------

Result<void> SqliteStateStore::putWorkerResult(const std::string& runId, const WorkerResult& r) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare(
        "INSERT OR REPLACE INTO worker_results (run_id, worker_id, worker_group_id, status, "
        "message, total_operations, failed_operations, find_max_result, reported_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    std::optional<std::string> findMax;
    if (r.findMax) {
        findMax = nlohmann::json(*r.findMax).dump();
    }
    const int64_t reportedAt = r.reportedAtMs > 0 ? r.reportedAtMs : epochMillis();
    auto bindResult = stmt.bindAll(runId, r.workerId, r.workerGroupId, control::toString(r.status),
                                   r.message, r.totalOperations, r.failedOperations, findMax,
                                   reportedAt);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<std::vector<WorkerResult>> SqliteStateStore::listWorkerResults(const std::string& runId) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare(
        "SELECT worker_id, worker_group_id, status, message, total_operations, "
        "failed_operations, find_max_result, reported_at FROM worker_results "
        "WHERE run_id = ? ORDER BY worker_group_id, worker_id");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, runId); !r)
        return r.error();

    std::vector<WorkerResult> rows;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        WorkerResult w;
        w.workerId = stmt.getString(0);
        w.workerGroupId = stmt.getInt(1);
        w.status = control::parseRunStatus(stmt.getString(2));
        w.message = stmt.getString(3);
        w.totalOperations = stmt.getInt64(4);
        w.failedOperations = stmt.getInt64(5);
        if (auto text = stmt.getOptionalString(6); text && !text->empty()) {
            auto parsed = parseJsonColumn(*text, "find_max_result");
            if (!parsed)
                return parsed.error();
            try {
                w.findMax = parsed.value().get<FindMaxResult>();
            } catch (const nlohmann::json::exception& e) {
                return Error{ErrorCode::InvalidData, std::string("find_max_result: ") + e.what()};
            }
        }
        w.reportedAtMs = stmt.getInt64(7);
        rows.push_back(std::move(w));
    }
    return rows;
}

Result<void> SqliteStateStore::putRunResult(const RunResult& r) {
    std::scoped_lock lock(mutex_);
    auto stmtResult = db_.prepare(
        "INSERT OR REPLACE INTO run_results (run_id, total_operations, failed_operations, "
        "workers_reported, find_max_result, completed_at) VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();

    std::optional<std::string> findMax;
    if (r.findMax) {
        findMax = nlohmann::json(*r.findMax).dump();
    }
    const int64_t completedAt = r.completedAtMs > 0 ? r.completedAtMs : epochMillis();
    auto bindResult = stmt.bindAll(r.runId, r.totalOperations, r.failedOperations,
                                   r.workersReported, findMax, completedAt);
    if (!bindResult)
        return bindResult;
    return stmt.execute();
}

Result<std::optional<RunResult>> SqliteStateStore::readRunResult(const std::string& runId) {
    std::scoped_lock lock(mutex_);
    auto stmtResult =
        db_.prepare("SELECT total_operations, failed_operations, workers_reported, "
                    "find_max_result, completed_at FROM run_results WHERE run_id = ?");
    if (!stmtResult)
        return stmtResult.error();
    auto stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, runId); !r)
        return r.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<RunResult>{};

    RunResult r;
    r.runId = runId;
    r.totalOperations = stmt.getInt64(0);
    r.failedOperations = stmt.getInt64(1);
    r.workersReported = stmt.getInt(2);
    if (auto text = stmt.getOptionalString(3); text && !text->empty()) {
        auto parsed = parseJsonColumn(*text, "find_max_result");
        if (!parsed)
            return parsed.error();
        try {
            r.findMax = parsed.value().get<AggregatedFindMaxResult>();
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidData, std::string("find_max_result: ") + e.what()};
        }
    }
    r.completedAtMs = stmt.getInt64(4);
    return std::optional<RunResult>{std::move(r)};
}

} // namespace surge::store
