#include "chronicle/cluster/event_cluster.hpp"

#include <algorithm>
#include <tuple>

namespace chronicle::cluster {

namespace {

auto key_mismatch(const char* what, event_type_id ta, const std::string& da, event_type_id tb,
                  const std::string& db) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::precondition_failed,
                            std::string("cannot merge ") + what + " of different keys: (" + std::to_string(ta) +
                                ", '" + da + "') vs (" + std::to_string(tb) + ", '" + db + "')",
                            "cluster.merge");
}

auto smallest_id(const EventCluster& c) -> std::uint64_t {
    return c.event_ids().isEmpty() ? 0 : c.event_ids().minimum();
}

auto cluster_order(const EventCluster& a, const EventCluster& b) -> bool {
    return std::make_tuple(a.span().start, a.span().end, smallest_id(a)) <
           std::make_tuple(b.span().start, b.span().end, smallest_id(b));
}

} // namespace

EventCluster::EventCluster(time_range span, event_type_id type, std::string description, description_lod lod,
                           id_set event_ids, id_set hash_hits, id_set tagged)
    : span_(span), type_(type), description_(std::move(description)), lod_(lod),
      event_ids_(std::move(event_ids)), hash_hits_(std::move(hash_hits)), tagged_(std::move(tagged)) {}

auto EventCluster::merge(const EventCluster& a, const EventCluster& b) -> std::expected<EventCluster, core::error> {
    if (a.type_ != b.type_ || a.description_ != b.description_) {
        return key_mismatch("clusters", a.type_, a.description_, b.type_, b.description_);
    }
    return EventCluster(a.span_.span_with(b.span_), a.type_, a.description_, a.lod_,
                        a.event_ids_ | b.event_ids_, a.hash_hits_ | b.hash_hits_, a.tagged_ | b.tagged_);
}

EventStripe::EventStripe(const EventCluster& cluster)
    : span_(cluster.span()), type_(cluster.type()), description_(cluster.description()), lod_(cluster.lod()),
      clusters_{cluster}, event_ids_(cluster.event_ids()), hash_hits_(cluster.event_ids_with_hash_hits()),
      tagged_(cluster.event_ids_with_tags()) {}

auto EventStripe::merge(const EventStripe& a, const EventStripe& b) -> std::expected<EventStripe, core::error> {
    if (a.type_ != b.type_ || a.description_ != b.description_) {
        return key_mismatch("stripes", a.type_, a.description_, b.type_, b.description_);
    }
    EventStripe out;
    out.span_ = a.span_.span_with(b.span_);
    out.type_ = a.type_;
    out.description_ = a.description_;
    out.lod_ = a.lod_;
    out.clusters_.reserve(a.clusters_.size() + b.clusters_.size());
    out.clusters_.insert(out.clusters_.end(), a.clusters_.begin(), a.clusters_.end());
    out.clusters_.insert(out.clusters_.end(), b.clusters_.begin(), b.clusters_.end());
    std::sort(out.clusters_.begin(), out.clusters_.end(), cluster_order);
    out.event_ids_ = a.event_ids_ | b.event_ids_;
    out.hash_hits_ = a.hash_hits_ | b.hash_hits_;
    out.tagged_ = a.tagged_ | b.tagged_;
    return out;
}

auto to_vector(const id_set& ids) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    out.reserve(static_cast<std::size_t>(ids.cardinality()));
    for (auto it = ids.begin(); it != ids.end(); ++it) out.push_back(static_cast<std::int64_t>(*it));
    return out;
}

} // namespace chronicle::cluster
