#pragma once

/** \file event_cluster.hpp
 *  \brief Aggregated views over events of one (type, description) key.
 *
 * Event id sets are Roaring bitmaps; merges are unions, so every merge here is
 * commutative and associative. Spans are half-open.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "roaring64map.hh"

#include "chronicle/error.hpp"
#include "chronicle/event.hpp"
#include "chronicle/event_type.hpp"
#include "chronicle/time_range.hpp"

namespace chronicle::cluster {

using id_set = roaring::Roaring64Map;

/** \brief Grouping key shared by every cluster of a stripe. */
struct cluster_key {
    event_type_id type{0};
    std::string description;

    friend auto operator<=>(const cluster_key&, const cluster_key&) = default;
    friend auto operator==(const cluster_key&, const cluster_key&) -> bool = default;
};

/** \brief Events of one key within one (possibly merged) time block. */
class EventCluster {
public:
    EventCluster(time_range span, event_type_id type, std::string description, description_lod lod,
                 id_set event_ids, id_set hash_hits, id_set tagged);

    /** \brief Union of two clusters of the same key; precondition_failed otherwise. */
    static auto merge(const EventCluster& a, const EventCluster& b) -> std::expected<EventCluster, core::error>;

    [[nodiscard]] auto span() const -> const time_range& { return span_; }
    [[nodiscard]] auto type() const -> event_type_id { return type_; }
    [[nodiscard]] auto description() const -> const std::string& { return description_; }
    [[nodiscard]] auto lod() const -> description_lod { return lod_; }
    [[nodiscard]] auto key() const -> cluster_key { return cluster_key{type_, description_}; }

    [[nodiscard]] auto event_ids() const -> const id_set& { return event_ids_; }
    [[nodiscard]] auto event_ids_with_hash_hits() const -> const id_set& { return hash_hits_; }
    [[nodiscard]] auto event_ids_with_tags() const -> const id_set& { return tagged_; }
    [[nodiscard]] auto size() const -> std::uint64_t { return event_ids_.cardinality(); }

    friend auto operator==(const EventCluster&, const EventCluster&) -> bool = default;

private:
    time_range span_;
    event_type_id type_;
    std::string description_;
    description_lod lod_;
    id_set event_ids_;
    id_set hash_hits_;
    id_set tagged_;
};

/** \brief All clusters of one key across the queried range. */
class EventStripe {
public:
    explicit EventStripe(const EventCluster& cluster);

    /** \brief Union of two stripes of the same key; precondition_failed otherwise. */
    static auto merge(const EventStripe& a, const EventStripe& b) -> std::expected<EventStripe, core::error>;

    [[nodiscard]] auto span() const -> const time_range& { return span_; }
    [[nodiscard]] auto type() const -> event_type_id { return type_; }
    [[nodiscard]] auto description() const -> const std::string& { return description_; }
    [[nodiscard]] auto lod() const -> description_lod { return lod_; }
    [[nodiscard]] auto key() const -> cluster_key { return cluster_key{type_, description_}; }

    /** \brief Member clusters ordered by (start, end, smallest id). */
    [[nodiscard]] auto clusters() const -> const std::vector<EventCluster>& { return clusters_; }

    [[nodiscard]] auto event_ids() const -> const id_set& { return event_ids_; }
    [[nodiscard]] auto event_ids_with_hash_hits() const -> const id_set& { return hash_hits_; }
    [[nodiscard]] auto event_ids_with_tags() const -> const id_set& { return tagged_; }
    [[nodiscard]] auto size() const -> std::uint64_t { return event_ids_.cardinality(); }

private:
    EventStripe() = default;

    time_range span_{};
    event_type_id type_{0};
    std::string description_;
    description_lod lod_{description_lod::short_form};
    std::vector<EventCluster> clusters_;
    id_set event_ids_;
    id_set hash_hits_;
    id_set tagged_;
};

/** \brief Ids of \p ids in ascending order. */
[[nodiscard]] auto to_vector(const id_set& ids) -> std::vector<std::int64_t>;

} // namespace chronicle::cluster
