#include "faulty_store.hpp"

namespace chronicle_test {

auto FaultyStore::check(std::string_view sql) const -> std::expected<void, chronicle::core::error> {
    for (const auto& fragment : fragments_) {
        if (sql.find(fragment) != std::string_view::npos) {
            ++injected_;
            return chronicle::core::make_error(chronicle::core::error_code::store_failed, "injected failure",
                                               "test.faulty_store", "statement matched '" + fragment + "'");
        }
    }
    return {};
}

auto FaultyStore::execute(std::string_view sql, const std::vector<chronicle::store::sql_value>& params)
    -> std::expected<std::int64_t, chronicle::core::error> {
    if (auto r = check(sql); !r) return std::unexpected(r.error());
    return inner_.execute(sql, params);
}

auto FaultyStore::insert(std::string_view sql, const std::vector<chronicle::store::sql_value>& params)
    -> std::expected<std::int64_t, chronicle::core::error> {
    if (auto r = check(sql); !r) return std::unexpected(r.error());
    return inner_.insert(sql, params);
}

auto FaultyStore::query(std::string_view sql, const std::vector<chronicle::store::sql_value>& params,
                        const chronicle::store::row_handler& on_row) const
    -> std::expected<void, chronicle::core::error> {
    if (auto r = check(sql); !r) return std::unexpected(r.error());
    return inner_.query(sql, params, on_row);
}

} // namespace chronicle_test
