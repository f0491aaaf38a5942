#pragma once

/** \file timeline_manager.hpp
 *  \brief Timeline queries, aggregation and event bookkeeping over a host store.
 *
 * Example usage:
 * ```cpp
 * auto store = chronicle::store::SqliteStore::open("case.db");
 * auto timeline = chronicle::TimelineManager::open(**store);
 *
 * chronicle::ZoomParams zoom{
 *     .range = {start, end},
 *     .filter = chronicle::make_default_root_filter(),
 *     .type_zoom = chronicle::type_zoom_level::base_type,
 *     .lod = chronicle::description_lod::short_form,
 * };
 * auto stripes = timeline->get_event_stripes(zoom);
 * ```
 *
 * Thread-safety: every read takes the store's shared lock for the duration of its
 * statement(s), every write the exclusive lock. In-memory cluster merging runs
 * after the lock is released.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "chronicle/cluster/event_cluster.hpp"
#include "chronicle/config.hpp"
#include "chronicle/diagnostics.hpp"
#include "chronicle/error.hpp"
#include "chronicle/event.hpp"
#include "chronicle/filter_expr.hpp"
#include "chronicle/store/host_store.hpp"
#include "chronicle/time_range.hpp"

namespace chronicle {

/** \brief Range, filter and the two explicit zoom levels of an aggregation query. */
struct ZoomParams {
    time_range range{};
    root_filter filter{make_default_root_filter()};
    type_zoom_level type_zoom{type_zoom_level::base_type};
    description_lod lod{description_lod::short_form};
};

class TimelineManager {
public:
    /** \brief Bind to \p store and create or upgrade the schema.
     *
     * \param store Host store; must outlive the manager
     * \param config Validated before use
     * \param sink Diagnostic sink; diag::default_sink() when null. Must outlive the manager
     */
    static auto open(store::HostStore& store, TimelineConfig config = {}, diag::DiagnosticSink* sink = nullptr)
        -> std::expected<TimelineManager, core::error>;

    ~TimelineManager();
    TimelineManager(TimelineManager&&) noexcept;
    TimelineManager& operator=(TimelineManager&&) noexcept;
    TimelineManager(const TimelineManager&) = delete;
    TimelineManager& operator=(const TimelineManager&) = delete;

    [[nodiscard]] auto config() const -> const TimelineConfig&;

    // --- schema ---

    /** \brief Create missing tables, indices and upgrade columns. Idempotent. */
    auto initialize_schema() -> std::expected<void, core::error>;

    /** \brief Drop every timeline table and recreate the empty schema. */
    auto reinitialize() -> std::expected<void, core::error>;

    /** \brief Drop and recreate the tags table. */
    auto reinitialize_tags() -> std::expected<void, core::error>;

    /** \brief Refresh the backend's planner statistics. */
    auto analyze() -> std::expected<void, core::error>;

    /** \brief Upgrade columns exist and at least one data source has been recorded. */
    auto has_new_columns() const -> std::expected<bool, core::error>;

    // --- writes ---

    /** \brief Insert one event with its hash-set hits and tags, atomically.
     *
     * \return The store-assigned event id
     */
    auto insert_event(const EventInsert& event) -> std::expected<std::int64_t, core::error>;

    /** \brief Mark the events of a file/artifact pair tagged and record \p tag on each.
     *
     * A null \p artifact_id selects only the file's own (content) events.
     * \return The affected event ids; empty when the legacy error swallowing applied
     */
    auto add_tag(std::int64_t file_id, std::optional<std::int64_t> artifact_id, const Tag& tag)
        -> std::expected<std::set<std::int64_t>, core::error>;

    /** \brief Remove tag \p tag_id and set the tagged flag of the pair's events to \p still_tagged. */
    auto delete_tag(std::int64_t file_id, std::optional<std::int64_t> artifact_id, std::int64_t tag_id,
                    bool still_tagged) -> std::expected<std::set<std::int64_t>, core::error>;

    // --- queries ---

    auto get_event_by_id(std::int64_t event_id) const -> std::expected<std::optional<Event>, core::error>;

    /** \brief Ids of matching events in [start, end), ascending by time then id. */
    auto get_event_ids(const time_range& range, const root_filter& filter) const
        -> std::expected<std::vector<std::int64_t>, core::error>;

    /** \brief Matching event counts per type at the zoom's type level; absent types are omitted. */
    auto count_events_by_type(const ZoomParams& zoom) const
        -> std::expected<std::map<event_type_id, std::int64_t>, core::error>;

    /** \brief Matching events grouped by (time, full description, file id), ordered by time then description. */
    auto get_combined_events(const time_range& range, const root_filter& filter) const
        -> std::expected<std::vector<CombinedEvent>, core::error>;

    /**
     * \brief Smallest interval around \p range bounded by matching event times: the latest
     * match at or before range.start and the earliest at or after range.end (global maximum
     * time when there is none). nullopt on an empty store.
     */
    auto get_bounding_events_interval(const time_range& range, const root_filter& filter) const
        -> std::expected<std::optional<time_range>, core::error>;

    /** \brief [min, max + 1) over the times of \p event_ids; nullopt when none exist. */
    auto get_spanning_interval(const std::vector<std::int64_t>& event_ids) const
        -> std::expected<std::optional<time_range>, core::error>;

    /** \brief Bucketed clusters after the cross-bucket merge. */
    auto get_event_clusters(const ZoomParams& zoom) const
        -> std::expected<std::vector<cluster::EventCluster>, core::error>;

    /** \brief One stripe per (type, description), ordered by start. */
    auto get_event_stripes(const ZoomParams& zoom) const
        -> std::expected<std::vector<cluster::EventStripe>, core::error>;

    auto count_all_events() const -> std::expected<std::int64_t, core::error>;
    auto get_min_time() const -> std::expected<std::optional<std::int64_t>, core::error>;
    auto get_max_time() const -> std::expected<std::optional<std::int64_t>, core::error>;

    /** \brief Distinct non-zero data source ids. */
    auto get_data_source_ids() const -> std::expected<std::set<std::int64_t>, core::error>;
    auto get_hash_set_names() const -> std::expected<std::map<std::int64_t, std::string>, core::error>;

    /** \brief Tag display name to number of distinct tags applied to \p event_ids. */
    auto get_tag_counts_by_tag_name(const std::set<std::int64_t>& event_ids) const
        -> std::expected<std::map<std::string, std::int64_t>, core::error>;

    auto get_event_ids_for_artifact(std::int64_t artifact_id) const
        -> std::expected<std::vector<std::int64_t>, core::error>;

    /** \brief Events of \p file_id; artifact-derived ones only when \p include_derived. */
    auto get_event_ids_for_file(std::int64_t file_id, bool include_derived) const
        -> std::expected<std::vector<std::int64_t>, core::error>;

    /** \brief The condition text every filtered query uses for \p filter. */
    auto sql_where(const root_filter& filter) const -> std::string;

private:
    class Impl;
    explicit TimelineManager(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace chronicle
