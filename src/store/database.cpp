#include <surge/store/database.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>
#include <utility>

namespace surge::store {

namespace {

constexpr int kBusyAttempts = 5;
constexpr auto kFirstBusyWait = std::chrono::milliseconds(2);
constexpr size_t kSqlPreview = 100;

Error bindError(sqlite3_stmt* stmt, int rc, int index) {
    return Error{ErrorCode::DatabaseError,
                 fmt::format("bind of parameter {} failed: {}", index,
                             stmt ? sqlite3_errmsg(sqlite3_db_handle(stmt)) : sqlite3_errstr(rc))};
}

std::string sqlPreview(sqlite3_stmt* stmt) {
    const char* sql = stmt ? sqlite3_sql(stmt) : nullptr;
    if (!sql)
        return {};
    std::string_view text(sql);
    if (text.size() <= kSqlPreview)
        return std::string(text);
    return std::string(text.substr(0, kSqlPreview)) + "...";
}

} // namespace

Statement::~Statement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_)
            sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (int rc = sqlite3_bind_null(stmt_, index); rc != SQLITE_OK)
        return bindError(stmt_, rc, index);
    return {};
}

Result<void> Statement::bind(int index, int value) {
    if (int rc = sqlite3_bind_int(stmt_, index, value); rc != SQLITE_OK)
        return bindError(stmt_, rc, index);
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (int rc = sqlite3_bind_int64(stmt_, index, value); rc != SQLITE_OK)
        return bindError(stmt_, rc, index);
    return {};
}

Result<void> Statement::bind(int index, double value) {
    if (int rc = sqlite3_bind_double(stmt_, index, value); rc != SQLITE_OK)
        return bindError(stmt_, rc, index);
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return bindError(stmt_, rc, index);
    return {};
}

Result<int> Statement::stepWithRetry() {
    if (!stmt_)
        return Error{ErrorCode::InvalidState, "statement is not prepared"};

    auto wait = kFirstBusyWait;
    int rc = SQLITE_OK;
    for (int attempt = 1; attempt <= kBusyAttempts; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED)
            return rc;
        if (attempt == kBusyAttempts)
            break;
        sqlite3_reset(stmt_);
        spdlog::debug("[StateStore] database busy, retry {} in {}ms", attempt, wait.count());
        std::this_thread::sleep_for(wait);
        wait *= 2;
    }
    return Error{ErrorCode::Timeout, fmt::format("database still busy after {} attempts: {}",
                                                 kBusyAttempts, sqlPreview(stmt_))};
}

Result<void> Statement::execute() {
    auto rc = stepWithRetry();
    if (!rc)
        return rc.error();
    if (rc.value() == SQLITE_DONE)
        return {};
    if (rc.value() == SQLITE_CONSTRAINT)
        return Error{ErrorCode::Conflict, fmt::format("constraint violated: {} [{}]",
                                                      sqlite3_errstr(rc.value()), sqlPreview(stmt_))};
    return Error{ErrorCode::DatabaseError,
                 fmt::format("statement failed: {}", sqlite3_errstr(rc.value()))};
}

Result<bool> Statement::step() {
    auto rc = stepWithRetry();
    if (!rc)
        return rc.error();
    switch (rc.value()) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            return Error{ErrorCode::DatabaseError,
                         fmt::format("query failed: {}", sqlite3_errstr(rc.value()))};
    }
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    closeHandle();
}

Database::Database(Database&& other) noexcept : db_(std::exchange(other.db_, nullptr)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        closeHandle();
        db_ = std::exchange(other.db_, nullptr);
    }
    return *this;
}

void Database::closeHandle() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<void> Database::open(const std::string& path, OpenMode mode) {
    closeHandle();
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (mode == OpenMode::Memory)
        flags |= SQLITE_OPEN_MEMORY;

    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        if (handle)
            sqlite3_close_v2(handle);
        return Error{ErrorCode::DatabaseError, fmt::format("cannot open {}: {}", path, reason)};
    }
    db_ = handle;
    return {};
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "database is not open"};

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt)
            sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("prepare failed: {}", sqlite3_errmsg(db_))};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "database is not open"};

    char* message = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message);
    if (rc == SQLITE_OK)
        return {};

    std::string reason = message ? message : sqlite3_errstr(rc);
    sqlite3_free(message);
    spdlog::error("[StateStore] exec failed: {}", reason);
    const auto code = (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) ? ErrorCode::Timeout
                                                                 : ErrorCode::DatabaseError;
    return Error{code, fmt::format("exec failed: {}", reason)};
}

void Database::rollbackQuietly() {
    if (auto r = execute("ROLLBACK"); !r)
        spdlog::warn("[StateStore] rollback failed: {}", r.error().message);
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_)
        return Error{ErrorCode::InvalidState, "database is not open"};
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK)
        return Error{ErrorCode::DatabaseError, "cannot set busy timeout"};
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL;PRAGMA synchronous=NORMAL");
}

std::string Database::version() {
    return sqlite3_libversion();
}

} // namespace surge::store
