#include "chronicle/store/sqlite_store.hpp"

#include <sqlite3.h>

#include <sstream>

namespace chronicle::store {

namespace {

constexpr const char* kComponent = "store.sqlite";

struct Stmt {
    sqlite3_stmt* s{nullptr};
    ~Stmt() { if (s) sqlite3_finalize(s); }
};

auto sql_error(sqlite3* db, int rc, std::string_view what, std::string_view sql) -> std::unexpected<core::error> {
    std::ostringstream cause;
    cause << sqlite3_errmsg(db) << " (rc=" << rc << ")";
    std::string message(what);
    if (!sql.empty()) {
        message += ": ";
        message += sql;
    }
    return core::make_error(core::error_code::store_failed, std::move(message), kComponent, cause.str());
}

auto prepare(sqlite3* db, std::string_view sql, const std::vector<sql_value>& params, Stmt& st)
    -> std::expected<void, core::error> {
    int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &st.s, nullptr);
    if (rc != SQLITE_OK) return sql_error(db, rc, "prepare", sql);
    const int expected_params = sqlite3_bind_parameter_count(st.s);
    if (expected_params != static_cast<int>(params.size())) {
        std::ostringstream oss;
        oss << "statement takes " << expected_params << " parameters, " << params.size() << " given";
        return core::make_error(core::error_code::invalid_argument, oss.str(), kComponent, std::string(sql));
    }
    for (std::size_t i = 0; i < params.size(); ++i) {
        const int index = static_cast<int>(i) + 1;
        const auto& p = params[i];
        if (std::holds_alternative<std::int64_t>(p)) {
            rc = sqlite3_bind_int64(st.s, index, static_cast<sqlite3_int64>(std::get<std::int64_t>(p)));
        } else if (std::holds_alternative<std::string>(p)) {
            const auto& text = std::get<std::string>(p);
            rc = sqlite3_bind_text(st.s, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_null(st.s, index);
        }
        if (rc != SQLITE_OK) return sql_error(db, rc, "bind", sql);
    }
    return {};
}

auto run_to_completion(sqlite3* db, Stmt& st, std::string_view sql) -> std::expected<void, core::error> {
    int rc;
    while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) return sql_error(db, rc, "step", sql);
    return {};
}

class SqliteRow final : public Row {
public:
    explicit SqliteRow(sqlite3_stmt* s) : s_(s) {}

    [[nodiscard]] auto column_count() const -> int override { return sqlite3_column_count(s_); }
    [[nodiscard]] auto is_null(int column) const -> bool override {
        return sqlite3_column_type(s_, column) == SQLITE_NULL;
    }
    [[nodiscard]] auto get_int64(int column) const -> std::int64_t override {
        return static_cast<std::int64_t>(sqlite3_column_int64(s_, column));
    }
    [[nodiscard]] auto get_text(int column) const -> std::string override {
        const auto* text = sqlite3_column_text(s_, column);
        if (text == nullptr) return {};
        return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(s_, column)));
    }
    [[nodiscard]] auto find_column(std::string_view name) const -> std::optional<int> override {
        const int n = column_count();
        for (int i = 0; i < n; ++i) {
            if (const char* col = sqlite3_column_name(s_, i); col != nullptr && name == col) return i;
        }
        return std::nullopt;
    }

private:
    sqlite3_stmt* s_;
};

} // namespace

auto SqliteStore::open(const std::string& path) -> std::expected<std::unique_ptr<SqliteStore>, core::error> {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string cause = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        return core::make_error(core::error_code::store_failed, "open " + path, kComponent, std::move(cause));
    }
    std::unique_ptr<SqliteStore> store(new SqliteStore(db, path));
    char* err = nullptr;
    rc = sqlite3_exec(db, "PRAGMA foreign_keys=ON;", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string cause = err ? err : "unknown";
        sqlite3_free(err);
        return core::make_error(core::error_code::store_failed, "configure connection", kComponent, std::move(cause));
    }
    return store;
}

SqliteStore::~SqliteStore() {
    if (db_) sqlite3_close(db_);
}

auto SqliteStore::execute(std::string_view sql, const std::vector<sql_value>& params)
    -> std::expected<std::int64_t, core::error> {
    Stmt st;
    if (auto r = prepare(db_, sql, params, st); !r) return std::unexpected(r.error());
    if (auto r = run_to_completion(db_, st, sql); !r) return std::unexpected(r.error());
    return static_cast<std::int64_t>(sqlite3_changes(db_));
}

auto SqliteStore::insert(std::string_view sql, const std::vector<sql_value>& params)
    -> std::expected<std::int64_t, core::error> {
    Stmt st;
    if (auto r = prepare(db_, sql, params, st); !r) return std::unexpected(r.error());
    if (auto r = run_to_completion(db_, st, sql); !r) return std::unexpected(r.error());
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

auto SqliteStore::query(std::string_view sql, const std::vector<sql_value>& params, const row_handler& on_row) const
    -> std::expected<void, core::error> {
    Stmt st;
    if (auto r = prepare(db_, sql, params, st); !r) return std::unexpected(r.error());
    SqliteRow row(st.s);
    int rc;
    while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
        if (auto r = on_row(row); !r) return std::unexpected(r.error());
    }
    if (rc != SQLITE_DONE) return sql_error(db_, rc, "step", sql);
    return {};
}

auto SqliteStore::begin_transaction() -> std::expected<void, core::error> {
    if (sqlite3_get_autocommit(db_) == 0) {
        return core::make_error(core::error_code::precondition_failed, "transaction already open", kComponent);
    }
    if (auto r = execute("BEGIN IMMEDIATE"); !r) return std::unexpected(r.error());
    return {};
}

auto SqliteStore::commit_transaction() -> std::expected<void, core::error> {
    if (auto r = execute("COMMIT"); !r) return std::unexpected(r.error());
    return {};
}

auto SqliteStore::rollback_transaction() -> std::expected<void, core::error> {
    // A failed COMMIT may already have ended the transaction.
    if (sqlite3_get_autocommit(db_) != 0) return {};
    if (auto r = execute("ROLLBACK"); !r) return std::unexpected(r.error());
    return {};
}

} // namespace chronicle::store
