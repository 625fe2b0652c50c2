#pragma once

#include <surge/store/database.h>
#include <surge/store/state_store.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace surge::store {

/**
 * @brief SharedStateStore backed by a single SQLite file in WAL mode.
 *
 * Every process that points at the same file sees the same rows; SQLite's
 * locking gives read-after-write consistency on one host. Each instance owns
 * one connection and serialises access to it.
 */
class SqliteStateStore final : public SharedStateStore {
public:
    struct Config {
        std::string path;
        std::chrono::milliseconds busyTimeout{5000};
    };

    static Result<std::unique_ptr<SqliteStateStore>> open(Config config);

    ~SqliteStateStore() override = default;

    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

    Result<void> createRun(const RunRecord& run) override;
    Result<RunRecord> readRun(const std::string& runId) override;
    Result<bool> transitionRun(const std::string& runId, const RunTransition& t) override;
    Result<std::vector<RunRecord>> listRuns(int limit) override;

    Result<void> upsertHeartbeat(const HeartbeatRecord& hb) override;
    Result<std::vector<HeartbeatRecord>> listHeartbeats(const std::string& runId) override;
    Result<int> deleteHeartbeats(const std::string& runId) override;

    Result<control::ControlEvent> appendControlEvent(const std::string& runId,
                                                     const control::ControlPayload& p) override;
    Result<std::vector<control::ControlEvent>>
    listControlEventsAfter(const std::string& runId, int64_t afterSequence) override;

    Result<void> appendStepRecord(const std::string& runId, const std::string& workerId,
                                  const StepRecord& step) override;
    Result<std::vector<WorkerStepRecord>>
    listStepRecords(const std::string& runId, const std::optional<std::string>& workerId) override;

    Result<void> putWorkerResult(const std::string& runId, const WorkerResult& r) override;
    Result<std::vector<WorkerResult>> listWorkerResults(const std::string& runId) override;
    Result<void> putRunResult(const RunResult& r) override;
    Result<std::optional<RunResult>> readRunResult(const std::string& runId) override;

    const std::string& path() const { return path_; }

private:
    SqliteStateStore(Database db, std::string path) : db_(std::move(db)), path_(std::move(path)) {}

    Result<void> initializeSchema();

    Database db_;
    std::string path_;
    std::mutex mutex_;
};

} // namespace surge::store
