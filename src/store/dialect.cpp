#include "chronicle/store/dialect.hpp"

namespace chronicle::store {

namespace {

auto join_columns(const std::vector<std::string>& columns) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i) out += ", ";
        out += columns[i];
    }
    return out;
}

auto placeholders(std::size_t n) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < n; ++i) out += i ? ", ?" : "?";
    return out;
}

// strftime(3) patterns for SQLite, to_char patterns for PostgreSQL.
auto strftime_format(time_unit unit) -> std::string_view {
    switch (unit) {
        case time_unit::years: return "%Y-01-01T00:00:00";
        case time_unit::months: return "%Y-%m-01T00:00:00";
        case time_unit::days: return "%Y-%m-%dT00:00:00";
        case time_unit::hours: return "%Y-%m-%dT%H:00:00";
        case time_unit::minutes: return "%Y-%m-%dT%H:%M:00";
        case time_unit::seconds: return "%Y-%m-%dT%H:%M:%S";
    }
    return "%Y-%m-%dT%H:%M:%S";
}

auto to_char_format(time_unit unit) -> std::string_view {
    switch (unit) {
        case time_unit::years: return "YYYY-\"01-01T00:00:00\"";
        case time_unit::months: return "YYYY-MM-\"01T00:00:00\"";
        case time_unit::days: return "YYYY-MM-DD\"T00:00:00\"";
        case time_unit::hours: return "YYYY-MM-DD\"T\"HH24\":00:00\"";
        case time_unit::minutes: return "YYYY-MM-DD\"T\"HH24:MI\":00\"";
        case time_unit::seconds: return "YYYY-MM-DD\"T\"HH24:MI:SS";
    }
    return "YYYY-MM-DD\"T\"HH24:MI:SS";
}

} // namespace

auto Dialect::quote(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('\'');
    for (char c : text) {
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

auto Dialect::escape_like(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// --- SQLite ---

auto SqliteDialect::group_concat(std::string_view expr, std::string_view separator) const -> std::string {
    return "group_concat(" + std::string(expr) + ", " + quote(separator) + ")";
}

auto SqliteDialect::time_bucket(std::string_view column, time_unit unit) const -> std::string {
    return "strftime('" + std::string(strftime_format(unit)) + "', " + std::string(column) + ", 'unixepoch')";
}

auto SqliteDialect::like(std::string_view column, std::string_view pattern, bool negate) const -> std::string {
    return std::string(column) + (negate ? " NOT LIKE " : " LIKE ") + quote(pattern) + " ESCAPE '\\'";
}

auto SqliteDialect::not_equal_null_safe(std::string_view column, std::string_view value) const -> std::string {
    return std::string(column) + " IS NOT " + std::string(value);
}

auto SqliteDialect::insert_or_ignore(std::string_view table, const std::vector<std::string>& columns) const
    -> std::string {
    return "INSERT OR IGNORE INTO " + std::string(table) + " (" + join_columns(columns) + ") VALUES (" +
           placeholders(columns.size()) + ")";
}

auto SqliteDialect::column_listing_query(std::string_view table) const -> std::string {
    return "PRAGMA table_info(" + std::string(table) + ")";
}

auto SqliteDialect::analyze_statements() const -> std::vector<std::string> {
    return {"ANALYZE", "ANALYZE sqlite_master"};
}

// --- PostgreSQL ---

auto PostgresDialect::group_concat(std::string_view expr, std::string_view separator) const -> std::string {
    return "string_agg(CAST(" + std::string(expr) + " AS VARCHAR), " + quote(separator) + ")";
}

auto PostgresDialect::time_bucket(std::string_view column, time_unit unit) const -> std::string {
    return "to_char(to_timestamp(" + std::string(column) + ") AT TIME ZONE 'UTC', '" +
           std::string(to_char_format(unit)) + "')";
}

auto PostgresDialect::like(std::string_view column, std::string_view pattern, bool negate) const -> std::string {
    return std::string(column) + (negate ? " NOT ILIKE " : " ILIKE ") + quote(pattern) + " ESCAPE '\\'";
}

auto PostgresDialect::not_equal_null_safe(std::string_view column, std::string_view value) const -> std::string {
    return std::string(column) + " IS DISTINCT FROM " + std::string(value);
}

auto PostgresDialect::insert_or_ignore(std::string_view table, const std::vector<std::string>& columns) const
    -> std::string {
    return "INSERT INTO " + std::string(table) + " (" + join_columns(columns) + ") VALUES (" +
           placeholders(columns.size()) + ") ON CONFLICT DO NOTHING";
}

auto PostgresDialect::column_listing_query(std::string_view table) const -> std::string {
    return "SELECT column_name AS name FROM information_schema.columns WHERE table_name = " + quote(table);
}

auto PostgresDialect::analyze_statements() const -> std::vector<std::string> {
    return {"ANALYZE"};
}

auto make_dialect(backend kind) -> std::unique_ptr<Dialect> {
    switch (kind) {
        case backend::sqlite: return std::make_unique<SqliteDialect>();
        case backend::postgresql: return std::make_unique<PostgresDialect>();
    }
    return std::make_unique<SqliteDialect>();
}

} // namespace chronicle::store
