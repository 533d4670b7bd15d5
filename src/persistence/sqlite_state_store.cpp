#include "conductor/persistence/sqlite_state_store.hpp"
#include <sqlite3.h>
#include <chrono>

namespace conductor {
namespace persistence {

namespace {

void finalize(sqlite3_stmt*& stmt) {
    if (stmt != nullptr) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }
}

// Resets a cached statement when the enclosing scope exits.
class StatementReset {
public:
    explicit StatementReset(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementReset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }
    StatementReset(const StatementReset&) = delete;
    StatementReset& operator=(const StatementReset&) = delete;

private:
    sqlite3_stmt* stmt_;
};

sqlite3_int64 epoch_millis() {
    return static_cast<sqlite3_int64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

SqliteStateStore::SqliteStateStore(sqlite3* db, std::string db_path)
    : db_(db)
    , db_path_(std::move(db_path))
{}

SqliteStateStore::~SqliteStateStore() {
    finalize(stmt_upsert_);
    finalize(stmt_select_);
    finalize(stmt_delete_);
    finalize(stmt_list_);
    finalize(stmt_size_);

    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Expected<std::shared_ptr<SqliteStateStore>> SqliteStateStore::open(const std::string& path) {
    if (path.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "State database path cannot be empty"});
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string message = "Failed to open state database";
        if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
            message += std::string(": ") + sqlite3_errmsg(db);
        }
        if (db != nullptr) {
            sqlite3_close(db);
        }
        return tl::unexpected(Error{ErrorCode::PersistenceFailed, std::move(message), path});
    }

    auto instance = std::shared_ptr<SqliteStateStore>(new SqliteStateStore(db, path));
    auto init_result = instance->initialize_schema();
    if (!init_result) {
        return tl::unexpected(init_result.error());
    }
    return instance;
}

Expected<void> SqliteStateStore::initialize_schema() {
    char* err_msg = nullptr;
    constexpr const char* schema_sql =
        "CREATE TABLE IF NOT EXISTS conductor_state("
        "thread_id TEXT PRIMARY KEY,"
        "state TEXT NOT NULL,"
        "updated_at INTEGER NOT NULL"
        ")";
    if (sqlite3_exec(db_, schema_sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
        sqlite3_free(err_msg);
        return tl::unexpected(Error{ErrorCode::PersistenceFailed, std::move(message), db_path_});
    }

    struct Prepared {
        const char* sql;
        sqlite3_stmt** stmt;
        const char* what;
    };
    const Prepared statements[] = {
        {"INSERT INTO conductor_state(thread_id, state, updated_at) VALUES (?1, ?2, ?3) "
         "ON CONFLICT(thread_id) DO UPDATE SET state = excluded.state, updated_at = excluded.updated_at",
         &stmt_upsert_, "upsert"},
        {"SELECT state FROM conductor_state WHERE thread_id = ?1", &stmt_select_, "select"},
        {"DELETE FROM conductor_state WHERE thread_id = ?1", &stmt_delete_, "delete"},
        {"SELECT thread_id FROM conductor_state ORDER BY updated_at DESC, thread_id", &stmt_list_, "list"},
        {"SELECT COUNT(*) FROM conductor_state", &stmt_size_, "size"},
    };
    for (const auto& p : statements) {
        if (sqlite3_prepare_v2(db_, p.sql, -1, p.stmt, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error(std::string("Failed to prepare cached ") + p.what + " statement"));
        }
    }
    return {};
}

Expected<void> SqliteStateStore::save_state(const std::string& thread_id, const Value& state) {
    if (thread_id.empty()) {
        return tl::unexpected(Error{ErrorCode::PersistenceFailed, "Thread id cannot be empty"});
    }

    std::string payload;
    try {
        payload = state.dump();
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{
            ErrorCode::PersistenceFailed,
            std::string("Failed to serialize state: ") + e.what(),
            thread_id
        });
    }

    std::lock_guard<std::mutex> lock(mutex_);
    StatementReset reset(stmt_upsert_);
    sqlite3_bind_text(stmt_upsert_, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 2, payload.c_str(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_upsert_, 3, epoch_millis());

    if (sqlite3_step(stmt_upsert_) != SQLITE_DONE) {
        return tl::unexpected(make_sql_error("Failed to save state for thread " + thread_id));
    }
    return {};
}

Expected<std::optional<Value>> SqliteStateStore::load_state(const std::string& thread_id) {
    std::string payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StatementReset reset(stmt_select_);
        sqlite3_bind_text(stmt_select_, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt_select_);
        if (rc == SQLITE_DONE) {
            return std::optional<Value>{};
        }
        if (rc != SQLITE_ROW) {
            return tl::unexpected(make_sql_error("Failed to load state for thread " + thread_id));
        }
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_select_, 0));
        const int bytes = sqlite3_column_bytes(stmt_select_, 0);
        payload.assign(text != nullptr ? text : "", static_cast<size_t>(bytes));
    }

    Value state = Value::parse(payload, nullptr, false);
    if (state.is_discarded()) {
        return tl::unexpected(Error{
            ErrorCode::StateDecodeFailed,
            "Stored state is not valid JSON",
            thread_id
        });
    }
    return std::optional<Value>{std::move(state)};
}

Expected<bool> SqliteStateStore::delete_state(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StatementReset reset(stmt_delete_);
    sqlite3_bind_text(stmt_delete_, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt_delete_) != SQLITE_DONE) {
        return tl::unexpected(make_sql_error("Failed to delete state for thread " + thread_id));
    }
    return sqlite3_changes(db_) > 0;
}

Expected<std::vector<std::string>> SqliteStateStore::list_threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StatementReset reset(stmt_list_);

    std::vector<std::string> ids;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt_list_)) == SQLITE_ROW) {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_list_, 0));
        ids.emplace_back(text != nullptr ? text : "");
    }
    if (rc != SQLITE_DONE) {
        return tl::unexpected(make_sql_error("Failed to list stored threads"));
    }
    return ids;
}

Expected<size_t> SqliteStateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StatementReset reset(stmt_size_);
    if (sqlite3_step(stmt_size_) != SQLITE_ROW) {
        return tl::unexpected(make_sql_error("Failed to count stored threads"));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt_size_, 0));
}

Error SqliteStateStore::make_sql_error(const std::string& prefix) const {
    return Error{
        ErrorCode::PersistenceFailed,
        prefix + ": " + sqlite3_errmsg(db_),
        db_path_
    };
}

} // namespace persistence
} // namespace conductor
