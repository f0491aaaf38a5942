#include "chronicle/cluster/cluster_merge.hpp"

#include <algorithm>
#include <charconv>
#include <map>
#include <tuple>

namespace chronicle::cluster {

namespace {

constexpr const char* kComponent = "cluster.merge";

auto within_tolerance(const time_range& earlier, const time_range& later, time_unit period,
                      std::int64_t divisor) -> bool {
    const auto gap = earlier.gap_to(later);
    if (!gap) return true;
    return gap->duration() <= period_seconds_from(gap->start, period) / divisor;
}

auto result_order(const EventCluster& a, const EventCluster& b) -> bool {
    return std::forward_as_tuple(a.span().start, a.type(), a.description(), a.span().end) <
           std::forward_as_tuple(b.span().start, b.type(), b.description(), b.span().end);
}

} // namespace

auto merge_clusters(std::vector<EventCluster> clusters, time_unit period, std::int64_t tolerance_divisor)
    -> std::expected<std::vector<EventCluster>, core::error> {
    if (tolerance_divisor < 1) {
        return core::make_error(core::error_code::invalid_argument,
                                "tolerance divisor must be positive, got " + std::to_string(tolerance_divisor),
                                kComponent);
    }

    // Arena indices grouped by key; clusters stay in the arena until merged.
    std::map<cluster_key, std::vector<std::size_t>> by_key;
    for (std::size_t i = 0; i < clusters.size(); ++i) by_key[clusters[i].key()].push_back(i);

    std::vector<EventCluster> merged;
    merged.reserve(clusters.size());
    for (auto& [key, indices] : by_key) {
        std::sort(indices.begin(), indices.end(), [&clusters](std::size_t a, std::size_t b) {
            return std::make_tuple(clusters[a].span().start, clusters[a].span().end, a) <
                   std::make_tuple(clusters[b].span().start, clusters[b].span().end, b);
        });
        EventCluster current = std::move(clusters[indices.front()]);
        for (std::size_t k = 1; k < indices.size(); ++k) {
            EventCluster& next = clusters[indices[k]];
            if (within_tolerance(current.span(), next.span(), period, tolerance_divisor)) {
                auto joined = EventCluster::merge(current, next);
                if (!joined) return std::unexpected(joined.error());
                current = std::move(*joined);
            } else {
                merged.push_back(std::move(current));
                current = std::move(next);
            }
        }
        merged.push_back(std::move(current));
    }
    std::sort(merged.begin(), merged.end(), result_order);
    return merged;
}

auto to_stripes(const std::vector<EventCluster>& clusters) -> std::expected<std::vector<EventStripe>, core::error> {
    std::map<cluster_key, std::vector<std::size_t>> by_key;
    for (std::size_t i = 0; i < clusters.size(); ++i) by_key[clusters[i].key()].push_back(i);

    std::vector<EventStripe> stripes;
    stripes.reserve(by_key.size());
    for (const auto& [key, indices] : by_key) {
        EventStripe stripe(clusters[indices.front()]);
        for (std::size_t k = 1; k < indices.size(); ++k) {
            auto joined = EventStripe::merge(stripe, EventStripe(clusters[indices[k]]));
            if (!joined) return std::unexpected(joined.error());
            stripe = std::move(*joined);
        }
        stripes.push_back(std::move(stripe));
    }
    std::sort(stripes.begin(), stripes.end(), [](const EventStripe& a, const EventStripe& b) {
        return std::forward_as_tuple(a.span().start, a.type(), a.description()) <
               std::forward_as_tuple(b.span().start, b.type(), b.description());
    });
    return stripes;
}

auto parse_id_list(std::string_view payload) -> std::expected<std::vector<std::int64_t>, core::error> {
    std::vector<std::int64_t> ids;
    if (payload.empty()) return ids;
    std::size_t pos = 0;
    while (true) {
        const auto comma = payload.find(',', pos);
        const auto token = payload.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
        std::int64_t value = 0;
        const auto* first = token.data();
        const auto* last = token.data() + token.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (token.empty() || ec != std::errc{} || ptr != last) {
            return core::make_error(core::error_code::data_integrity,
                                    "malformed group-concat element '" + std::string(token) + "'", kComponent,
                                    std::string(payload));
        }
        ids.push_back(value);
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    return ids;
}

auto parse_id_set(std::string_view payload) -> std::expected<id_set, core::error> {
    auto ids = parse_id_list(payload);
    if (!ids) return std::unexpected(ids.error());
    id_set out;
    for (auto id : *ids) {
        if (id < 0) {
            return core::make_error(core::error_code::data_integrity, "negative event id " + std::to_string(id),
                                    kComponent, std::string(payload));
        }
        out.add(static_cast<std::uint64_t>(id));
    }
    return out;
}

} // namespace chronicle::cluster
