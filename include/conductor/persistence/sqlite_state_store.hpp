#pragma once

#include "../types.hpp"
#include "../providers/IPersistenceAdapter.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace conductor {
namespace persistence {

/**
 * @brief Durable IPersistenceAdapter backed by a single SQLite table.
 *
 * Schema:
 * @code
 * conductor_state(thread_id TEXT PRIMARY KEY, state TEXT NOT NULL, updated_at INTEGER NOT NULL)
 * @endcode
 *
 * `state` holds the serialized state dict; `updated_at` is epoch milliseconds.
 * Pass ":memory:" as the path for a private in-memory database.
 *
 * @threadsafety All methods serialize on an internal mutex.
 */
class SqliteStateStore : public providers::IPersistenceAdapter {
public:
    ~SqliteStateStore() override;

    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

    /**
     * @brief Open (or create) the database and prepare statements.
     *
     * @return Store, or InvalidConfig for an empty path, or PersistenceFailed
     */
    static Expected<std::shared_ptr<SqliteStateStore>> open(const std::string& path);

    Expected<void> save_state(const std::string& thread_id, const Value& state) override;
    Expected<std::optional<Value>> load_state(const std::string& thread_id) override;

    /// @return true if a row was removed
    Expected<bool> delete_state(const std::string& thread_id);

    /// Thread ids ordered by most recent update first.
    Expected<std::vector<std::string>> list_threads() const;

    Expected<size_t> size() const;

    const std::string& path() const { return db_path_; }

private:
    SqliteStateStore(sqlite3* db, std::string db_path);

    Expected<void> initialize_schema();
    Error make_sql_error(const std::string& prefix) const;

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;

    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_select_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
    sqlite3_stmt* stmt_size_ = nullptr;
};

} // namespace persistence
} // namespace conductor
