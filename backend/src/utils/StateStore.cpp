#include "utils/StateStore.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace tf::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

// Hands a cached statement back in a reusable state however the caller
// leaves.
class StatementScope
{
  public:
    explicit StatementScope(sqlite3_stmt *stmt) : stmt_(stmt) {}
    StatementScope(StatementScope const &) = delete;
    StatementScope &operator=(StatementScope const &) = delete;
    ~StatementScope()
    {
        if (stmt_ != nullptr)
        {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }
    }

  private:
    sqlite3_stmt *stmt_;
};

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto const *text = sqlite3_column_text(stmt, index);
    if (text == nullptr)
    {
        return {};
    }
    return std::string(reinterpret_cast<char const *>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

DispatchRecord read_record(sqlite3_stmt *stmt)
{
    DispatchRecord record;
    record.run_id = column_text(stmt, 0);
    record.unit_id = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
    record.names = tf::json::read_string_array(column_text(stmt, 2));
    record.bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
    record.dispatched_at = sqlite3_column_int64(stmt, 4);
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL)
    {
        record.confirmed_at = sqlite3_column_int64(stmt, 5);
    }
    return record;
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    if (auto parent = path_.parent_path(); !parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            TF_LOG_ERROR("cannot create journal directory {}: {}",
                         parent.string(), ec.message());
            return;
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        TF_LOG_ERROR("cannot open journal {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!execute("PRAGMA journal_mode=WAL;"))
    {
        TF_LOG_WARN("journal {} stays in rollback mode", path_.string());
    }
    if (!ensure_schema())
    {
        TF_LOG_ERROR("journal {} has an unusable schema", path_.string());
        close();
    }
}

Database::~Database()
{
    close();
}

void Database::close()
{
    for (auto &[sql, stmt] : stmt_cache_)
    {
        sqlite3_finalize(stmt);
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc == SQLITE_OK)
    {
        return true;
    }
    TF_LOG_WARN("sqlite: {} ({})", err_msg ? err_msg : sqlite3_errstr(rc),
                sql);
    sqlite3_free(err_msg);
    return false;
}

// The schema version lives in PRAGMA user_version. Each migration runs in
// its own transaction together with the version bump.
bool Database::ensure_schema()
{
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
    };

    auto current = schema_version();
    if (!current)
    {
        return false;
    }
    for (auto const &migration : kMigrations)
    {
        if (*current >= migration.version)
        {
            continue;
        }
        if (!execute("BEGIN IMMEDIATE;"))
        {
            return false;
        }
        if (!(this->*migration.apply)() ||
            !execute(std::format("PRAGMA user_version = {};",
                                 migration.version)) ||
            !execute("COMMIT;"))
        {
            execute("ROLLBACK;");
            TF_LOG_ERROR("journal schema migration v{} failed",
                         migration.version);
            return false;
        }
        current = migration.version;
    }
    return true;
}

std::optional<int> Database::schema_version() const
{
    auto *stmt = prepare_cached("PRAGMA user_version;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementScope scope(stmt);
    if (sqlite3_step(stmt) != SQLITE_ROW)
    {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt, 0);
}

bool Database::apply_migration_v1() const
{
    return execute("CREATE TABLE IF NOT EXISTS dispatch_units ("
                   "run_id TEXT NOT NULL,"
                   "unit_id INTEGER NOT NULL,"
                   "names TEXT NOT NULL,"
                   "bytes INTEGER NOT NULL,"
                   "dispatched_at INTEGER NOT NULL,"
                   "confirmed_at INTEGER,"
                   "PRIMARY KEY (run_id, unit_id));") &&
           execute("CREATE INDEX IF NOT EXISTS dispatch_units_unconfirmed "
                   "ON dispatch_units (confirmed_at, dispatched_at);");
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    if (auto it = stmt_cache_.find(sql); it != stmt_cache_.end())
    {
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        TF_LOG_WARN("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::insert_dispatch(DispatchRecord const &record) const
{
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO dispatch_units (run_id, unit_id, names, "
        "bytes, dispatched_at, confirmed_at) VALUES (?, ?, ?, ?, ?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    StatementScope scope(stmt);
    auto names = tf::json::write_string_array(record.names);
    sqlite3_bind_text(stmt, 1, record.run_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(record.unit_id));
    sqlite3_bind_text(stmt, 3, names.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(record.bytes));
    sqlite3_bind_int64(stmt, 5, record.dispatched_at);
    if (record.confirmed_at)
    {
        sqlite3_bind_int64(stmt, 6, *record.confirmed_at);
    }
    else
    {
        sqlite3_bind_null(stmt, 6);
    }
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::mark_confirmed(std::string const &run_id, std::uint64_t unit_id,
                              std::int64_t confirmed_at) const
{
    auto *stmt = prepare_cached(
        "UPDATE dispatch_units SET confirmed_at = ? WHERE run_id = ? AND "
        "unit_id = ? AND confirmed_at IS NULL;");
    if (stmt == nullptr)
    {
        return false;
    }
    StatementScope scope(stmt);
    sqlite3_bind_int64(stmt, 1, confirmed_at);
    sqlite3_bind_text(stmt, 2, run_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(unit_id));
    return sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

std::optional<DispatchRecord>
Database::find_dispatch(std::string const &run_id, std::uint64_t unit_id) const
{
    auto *stmt = prepare_cached(
        "SELECT run_id, unit_id, names, bytes, dispatched_at, confirmed_at "
        "FROM dispatch_units WHERE run_id = ? AND unit_id = ? LIMIT 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementScope scope(stmt);
    sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(unit_id));
    if (sqlite3_step(stmt) != SQLITE_ROW)
    {
        return std::nullopt;
    }
    return read_record(stmt);
}

std::vector<DispatchRecord>
Database::unconfirmed(std::string const &run_id) const
{
    std::vector<DispatchRecord> records;
    auto *stmt = prepare_cached(
        "SELECT run_id, unit_id, names, bytes, dispatched_at, confirmed_at "
        "FROM dispatch_units WHERE confirmed_at IS NULL AND "
        "(?1 = '' OR run_id = ?1) ORDER BY dispatched_at, unit_id;");
    if (stmt == nullptr)
    {
        return records;
    }
    StatementScope scope(stmt);
    sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        records.push_back(read_record(stmt));
    }
    return records;
}

bool Database::delete_confirmed_before(std::int64_t timestamp) const
{
    auto *stmt = prepare_cached(
        "DELETE FROM dispatch_units WHERE confirmed_at IS NOT NULL AND "
        "confirmed_at < ?;");
    if (stmt == nullptr)
    {
        return false;
    }
    StatementScope scope(stmt);
    sqlite3_bind_int64(stmt, 1, timestamp);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

std::optional<std::int64_t> Database::count_dispatches() const
{
    auto *stmt = prepare_cached("SELECT COUNT(*) FROM dispatch_units;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementScope scope(stmt);
    if (sqlite3_step(stmt) != SQLITE_ROW)
    {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, 0);
}

} // namespace tf::storage
