#pragma once

/** \file sqlite_store.hpp
 *  \brief HostStore over a single serialized SQLite3 connection.
 */

#include <expected>
#include <memory>
#include <string>

#include "chronicle/store/host_store.hpp"

struct sqlite3;

namespace chronicle::store {

class SqliteStore final : public HostStore {
public:
    /** \brief Open (or create) \p path; ":memory:" gives a private in-memory database. */
    static auto open(const std::string& path) -> std::expected<std::unique_ptr<SqliteStore>, core::error>;

    ~SqliteStore() override;
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    [[nodiscard]] auto dialect() const -> const Dialect& override { return dialect_; }

    auto execute(std::string_view sql, const std::vector<sql_value>& params = {})
        -> std::expected<std::int64_t, core::error> override;
    auto insert(std::string_view sql, const std::vector<sql_value>& params)
        -> std::expected<std::int64_t, core::error> override;
    auto query(std::string_view sql, const std::vector<sql_value>& params, const row_handler& on_row) const
        -> std::expected<void, core::error> override;

    auto begin_transaction() -> std::expected<void, core::error> override;
    auto commit_transaction() -> std::expected<void, core::error> override;
    auto rollback_transaction() -> std::expected<void, core::error> override;

    [[nodiscard]] auto path() const -> const std::string& { return path_; }

private:
    SqliteStore(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

    sqlite3* db_{nullptr};
    std::string path_;
    SqliteDialect dialect_;
};

} // namespace chronicle::store
