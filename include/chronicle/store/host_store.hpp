#pragma once

/** \file host_store.hpp
 *  \brief The transactional store the timeline runs on.
 *
 * The store owns the connection, the transaction and the reader/writer lock; the
 * timeline only borrows them. Statements use positional '?' parameters.
 *
 * Thread-safety: execute/insert/query may be called concurrently as long as
 * callers hold read_lock() (queries) or write_lock() (everything else).
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "chronicle/error.hpp"
#include "chronicle/store/dialect.hpp"

namespace chronicle::store {

/** \brief A bound parameter: NULL, integer or text. */
using sql_value = std::variant<std::monostate, std::int64_t, std::string>;

inline auto null_or(const std::optional<std::int64_t>& v) -> sql_value {
    return v ? sql_value{*v} : sql_value{};
}

/** \brief Read-only view of the current result row; valid only inside the callback. */
class Row {
public:
    virtual ~Row() = default;
    [[nodiscard]] virtual auto column_count() const -> int = 0;
    [[nodiscard]] virtual auto is_null(int column) const -> bool = 0;
    [[nodiscard]] virtual auto get_int64(int column) const -> std::int64_t = 0;
    [[nodiscard]] virtual auto get_text(int column) const -> std::string = 0;
    [[nodiscard]] virtual auto find_column(std::string_view name) const -> std::optional<int> = 0;

    [[nodiscard]] auto get_optional_int64(int column) const -> std::optional<std::int64_t> {
        if (is_null(column)) return std::nullopt;
        return get_int64(column);
    }
};

/** \brief Invoked once per row; an error stops iteration and is returned from query(). */
using row_handler = std::function<std::expected<void, core::error>(const Row&)>;

class HostStore {
public:
    virtual ~HostStore() = default;

    [[nodiscard]] virtual auto dialect() const -> const Dialect& = 0;

    /** \brief Run a statement; returns the number of rows changed. */
    virtual auto execute(std::string_view sql, const std::vector<sql_value>& params = {})
        -> std::expected<std::int64_t, core::error> = 0;

    /** \brief Run an INSERT; returns the generated primary key. */
    virtual auto insert(std::string_view sql, const std::vector<sql_value>& params)
        -> std::expected<std::int64_t, core::error> = 0;

    virtual auto query(std::string_view sql, const std::vector<sql_value>& params, const row_handler& on_row) const
        -> std::expected<void, core::error> = 0;

    virtual auto begin_transaction() -> std::expected<void, core::error> = 0;
    virtual auto commit_transaction() -> std::expected<void, core::error> = 0;
    virtual auto rollback_transaction() -> std::expected<void, core::error> = 0;

    [[nodiscard]] auto read_lock() const -> std::shared_lock<std::shared_mutex> {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }
    [[nodiscard]] auto write_lock() const -> std::unique_lock<std::shared_mutex> {
        return std::unique_lock<std::shared_mutex>(mutex_);
    }

private:
    mutable std::shared_mutex mutex_;
};

/**
 * \brief Scoped transaction. Rolls back on destruction unless committed or
 * explicitly rolled back.
 */
class Transaction {
public:
    static auto begin(HostStore& store) -> std::expected<Transaction, core::error>;

    Transaction(Transaction&& other) noexcept : store_(other.store_) { other.store_ = nullptr; }
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    ~Transaction();

    auto commit() -> std::expected<void, core::error>;
    auto rollback() -> std::expected<void, core::error>;

private:
    explicit Transaction(HostStore& store) : store_(&store) {}
    HostStore* store_;
};

} // namespace chronicle::store
