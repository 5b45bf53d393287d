#include <spdlog/spdlog.h>
#include <thread>
#include <utility>
#include <verity/storage/database.h>

namespace verity::storage {

namespace {

constexpr int kStepAttempts = 4;
constexpr std::chrono::milliseconds kLockBackoff{15};
constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};

Result<void> bindStatus(int rc, int index) {
    if (rc == SQLITE_OK) {
        return {};
    }
    return Error{ErrorCode::DatabaseError,
                 fmt::format("Cannot bind parameter {}: {}", index, sqlite3_errstr(rc))};
}

bool isLockContention(int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

} // namespace

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return bindStatus(sqlite3_bind_null(stmt_, index), index);
}

Result<void> Statement::bind(int index, int value) {
    return bindStatus(sqlite3_bind_int(stmt_, index, value), index);
}

Result<void> Statement::bind(int index, int64_t value) {
    return bindStatus(sqlite3_bind_int64(stmt_, index, value), index);
}

Result<void> Statement::bind(int index, double value) {
    return bindStatus(sqlite3_bind_double(stmt_, index, value), index);
}

Result<void> Statement::bind(int index, std::string_view value) {
    const char* data = value.data() ? value.data() : "";
    return bindStatus(
        sqlite3_bind_text64(stmt_, index, data, value.size(), SQLITE_TRANSIENT, SQLITE_UTF8),
        index);
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return bindStatus(sqlite3_bind_blob64(stmt_, index, blob.data(), blob.size(), SQLITE_TRANSIENT),
                      index);
}

Error Statement::stepError(int rc) const {
    sqlite3* owner = sqlite3_db_handle(stmt_);
    std::string detail = owner ? sqlite3_errmsg(owner) : sqlite3_errstr(rc);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            std::string_view text(sql);
            detail += fmt::format(" [{}{}]", text.substr(0, 80), text.size() > 80 ? "..." : "");
        }
    }
    return Error{ErrorCode::DatabaseError, std::move(detail)};
}

Result<bool> Statement::step() {
    int rc = SQLITE_ERROR;
    for (int attempt = 1; attempt <= kStepAttempts; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (!isLockContention(rc) || attempt == kStepAttempts) {
            break;
        }
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(kLockBackoff * attempt);
    }

    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return stepError(rc);
}

Result<void> Statement::execute() {
    while (true) {
        auto row = step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            return {};
        }
    }
}

Result<void> Statement::reset() {
    sqlite3_reset(stmt_);
    if (sqlite3_clear_bindings(stmt_) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Cannot clear statement bindings"};
    }
    return {};
}

int64_t Statement::int64At(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::doubleAt(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::textAt(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    const int bytes = sqlite3_column_bytes(stmt_, column);
    if (!text || bytes <= 0) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
}

std::vector<std::byte> Statement::blobAt(int column) const {
    const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, column));
    const int bytes = sqlite3_column_bytes(stmt_, column);
    if (!data || bytes <= 0) {
        return {};
    }
    return std::vector<std::byte>(data, data + bytes);
}

bool Statement::nullAt(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::optional<int64_t> Statement::optionalInt64At(int column) const {
    return nullAt(column) ? std::nullopt : std::optional<int64_t>(int64At(column));
}

std::optional<std::string> Statement::optionalTextAt(int column) const {
    return nullAt(column) ? std::nullopt : std::optional<std::string>(textAt(column));
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, OpenMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, fmt::format("Database {} is already open", path_)};
    }

    int flags = SQLITE_OPEN_FULLMUTEX;
    switch (mode) {
        case OpenMode::Create:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case OpenMode::InMemory:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }

    const std::string target = mode == OpenMode::InMemory ? ":memory:" : path;
    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(target.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Cannot open database {}: {}", target, reason)};
    }

    db_ = handle;
    path_ = target;
    if (auto r = setBusyTimeout(kDefaultBusyTimeout); !r) {
        close();
        return r;
    }
    spdlog::debug("Opened {} with SQLite {}", path_, sqlite3_libversion());
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database is not open"};
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc =
        sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Cannot prepare statement: {}", sqlite3_errmsg(db_))};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database is not open"};
    }
    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message ? message : sqlite3_errmsg(db_);
        sqlite3_free(message);
        spdlog::debug("sqlite3_exec failed: {}", reason);
        return Error{ErrorCode::DatabaseError, std::move(reason)};
    }
    return {};
}

void Database::rollbackQuietly() {
    if (auto r = execute("ROLLBACK"); !r) {
        spdlog::error("Rollback on {} failed: {}", path_, r.error().message);
    }
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::hasFTS5() {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database is not open"};
    }
    if (sqlite3_exec(db_, "CREATE VIRTUAL TABLE temp.verity_fts5_check USING fts5(x)", nullptr,
                     nullptr, nullptr) != SQLITE_OK) {
        return false;
    }
    if (auto r = execute("DROP TABLE temp.verity_fts5_check"); !r) {
        return r.error();
    }
    return true;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database is not open"};
    }
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Cannot set busy timeout"};
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

} // namespace verity::storage
