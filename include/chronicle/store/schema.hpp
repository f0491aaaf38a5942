#pragma once

/** \file schema.hpp
 *  \brief Persisted shape of the timeline tables and its (re)initialization.
 *
 * Callers hold the store's write lock. Every DDL step is guarded on its own and a
 * failure is reported as schema_failed naming the step.
 */

#include <expected>
#include <string_view>

#include "chronicle/error.hpp"
#include "chronicle/store/host_store.hpp"

namespace chronicle::store::schema {

inline constexpr std::string_view events_table = "events";
inline constexpr std::string_view tags_table = "tags";
inline constexpr std::string_view hash_sets_table = "hash_sets";
inline constexpr std::string_view hash_set_hits_table = "hash_set_hits";
inline constexpr std::string_view db_info_table = "db_info";

/** \brief Create missing tables and indices, then add upgrade columns. Idempotent. */
auto initialize(HostStore& store) -> std::expected<void, core::error>;

/** \brief Add datasource_id, tagged and hash_hit to an older events table. No-op when present. */
auto upgrade_columns(HostStore& store) -> std::expected<void, core::error>;

/** \brief Whether all upgrade columns exist. */
auto has_upgrade_columns(const HostStore& store) -> std::expected<bool, core::error>;

/** \brief Drop every timeline table. */
auto drop_all(HostStore& store) -> std::expected<void, core::error>;

/** \brief Drop and recreate the tags table; tagged flags on events are left as they are. */
auto reset_tags(HostStore& store) -> std::expected<void, core::error>;

} // namespace chronicle::store::schema
