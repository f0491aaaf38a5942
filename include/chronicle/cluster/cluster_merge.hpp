#pragma once

/** \file cluster_merge.hpp
 *  \brief Cross-bucket cluster merging and stripe consolidation.
 *
 * Both passes run on already fetched data and hold no store lock. Output order is
 * a pure function of the input multiset of clusters.
 */

#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

#include "chronicle/cluster/event_cluster.hpp"
#include "chronicle/error.hpp"
#include "chronicle/time_range.hpp"

namespace chronicle::cluster {

/**
 * \brief Merge clusters of the same key whose spans overlap, abut, or are separated by
 * at most period(gap start) / \p tolerance_divisor seconds.
 *
 * Within a key clusters are walked in (start, end) order; the result is ordered by
 * (start, type, description, end). \p tolerance_divisor must be positive.
 */
auto merge_clusters(std::vector<EventCluster> clusters, time_unit period, std::int64_t tolerance_divisor)
    -> std::expected<std::vector<EventCluster>, core::error>;

/** \brief Fold clusters into one stripe per key, ordered by (start, type, description). */
auto to_stripes(const std::vector<EventCluster>& clusters) -> std::expected<std::vector<EventStripe>, core::error>;

/**
 * \brief Parse a comma separated group-concat payload of integer ids.
 *
 * An empty payload is an empty list; an empty or non-numeric element is data_integrity.
 */
auto parse_id_list(std::string_view payload) -> std::expected<std::vector<std::int64_t>, core::error>;

/** \brief parse_id_list into a bitmap; negative ids are data_integrity. */
auto parse_id_set(std::string_view payload) -> std::expected<id_set, core::error>;

} // namespace chronicle::cluster
