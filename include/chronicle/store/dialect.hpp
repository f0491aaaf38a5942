#pragma once

/** \file dialect.hpp
 *  \brief Backend-specific SQL fragments, supplied by the host store at open time.
 *
 * Query construction never branches on the backend; it asks the dialect.
 */

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "chronicle/time_range.hpp"

namespace chronicle::store {

enum class backend : std::uint8_t { sqlite, postgresql };

class Dialect {
public:
    virtual ~Dialect() = default;

    [[nodiscard]] virtual auto kind() const -> backend = 0;
    [[nodiscard]] virtual auto true_literal() const -> std::string_view = 0;
    [[nodiscard]] virtual auto false_literal() const -> std::string_view = 0;
    /** \brief Column type of an auto-generated numeric primary key. */
    [[nodiscard]] virtual auto primary_key_type() const -> std::string_view = 0;

    /** \brief Aggregate concatenating \p expr across grouped rows, NULLs skipped. */
    [[nodiscard]] virtual auto group_concat(std::string_view expr, std::string_view separator) const
        -> std::string = 0;

    /**
     * \brief Expression mapping a seconds-since-epoch column to the text label of
     * its UTC \p unit block ("YYYY-MM-DDTHH:MM:SS" with finer fields zeroed).
     */
    [[nodiscard]] virtual auto time_bucket(std::string_view column, time_unit unit) const -> std::string = 0;

    /** \brief Case-insensitive LIKE; \p pattern is already escaped with '\'. */
    [[nodiscard]] virtual auto like(std::string_view column, std::string_view pattern, bool negate) const
        -> std::string = 0;

    /** \brief column != value, treating NULL as different from every value. */
    [[nodiscard]] virtual auto not_equal_null_safe(std::string_view column, std::string_view value) const
        -> std::string = 0;

    /** \brief INSERT that silently skips rows violating a uniqueness constraint. */
    [[nodiscard]] virtual auto insert_or_ignore(std::string_view table, const std::vector<std::string>& columns) const
        -> std::string = 0;

    /** \brief Query returning one row per column of \p table with the name in column "name". */
    [[nodiscard]] virtual auto column_listing_query(std::string_view table) const -> std::string = 0;

    [[nodiscard]] virtual auto analyze_statements() const -> std::vector<std::string> = 0;

    /** \brief 'text' with embedded quotes doubled. */
    [[nodiscard]] static auto quote(std::string_view text) -> std::string;

    /** \brief Escape LIKE wildcards and the escape character itself with '\'. */
    [[nodiscard]] static auto escape_like(std::string_view text) -> std::string;
};

class SqliteDialect final : public Dialect {
public:
    [[nodiscard]] auto kind() const -> backend override { return backend::sqlite; }
    [[nodiscard]] auto true_literal() const -> std::string_view override { return "1"; }
    [[nodiscard]] auto false_literal() const -> std::string_view override { return "0"; }
    [[nodiscard]] auto primary_key_type() const -> std::string_view override { return "INTEGER"; }
    [[nodiscard]] auto group_concat(std::string_view expr, std::string_view separator) const -> std::string override;
    [[nodiscard]] auto time_bucket(std::string_view column, time_unit unit) const -> std::string override;
    [[nodiscard]] auto like(std::string_view column, std::string_view pattern, bool negate) const -> std::string override;
    [[nodiscard]] auto not_equal_null_safe(std::string_view column, std::string_view value) const -> std::string override;
    [[nodiscard]] auto insert_or_ignore(std::string_view table, const std::vector<std::string>& columns) const
        -> std::string override;
    [[nodiscard]] auto column_listing_query(std::string_view table) const -> std::string override;
    [[nodiscard]] auto analyze_statements() const -> std::vector<std::string> override;
};

class PostgresDialect final : public Dialect {
public:
    [[nodiscard]] auto kind() const -> backend override { return backend::postgresql; }
    [[nodiscard]] auto true_literal() const -> std::string_view override { return "TRUE"; }
    [[nodiscard]] auto false_literal() const -> std::string_view override { return "FALSE"; }
    [[nodiscard]] auto primary_key_type() const -> std::string_view override { return "BIGSERIAL"; }
    [[nodiscard]] auto group_concat(std::string_view expr, std::string_view separator) const -> std::string override;
    [[nodiscard]] auto time_bucket(std::string_view column, time_unit unit) const -> std::string override;
    [[nodiscard]] auto like(std::string_view column, std::string_view pattern, bool negate) const -> std::string override;
    [[nodiscard]] auto not_equal_null_safe(std::string_view column, std::string_view value) const -> std::string override;
    [[nodiscard]] auto insert_or_ignore(std::string_view table, const std::vector<std::string>& columns) const
        -> std::string override;
    [[nodiscard]] auto column_listing_query(std::string_view table) const -> std::string override;
    [[nodiscard]] auto analyze_statements() const -> std::vector<std::string> override;
};

[[nodiscard]] auto make_dialect(backend kind) -> std::unique_ptr<Dialect>;

} // namespace chronicle::store
