#include "timeline_fixture.hpp"

#include <stdexcept>

namespace chronicle_test {

chronicle::EventInsert event_spec::to_insert() const {
    chronicle::EventInsert ev;
    ev.time = time;
    ev.type = type;
    ev.data_source_id = data_source_id;
    ev.file_id = file_id;
    ev.artifact_id = artifact_id;
    ev.full_description = description;
    ev.med_description = med_description.empty() ? description : med_description;
    ev.short_description = short_description.empty() ? description : short_description;
    ev.known = known;
    ev.hash_set_names = hash_sets;
    ev.tags = tags;
    return ev;
}

TimelineFixture::TimelineFixture(chronicle::TimelineConfig config) {
    auto store = chronicle::store::SqliteStore::open(":memory:");
    if (!store) throw std::runtime_error("open in-memory store: " + store.error().message);
    store_ = std::move(*store);
    auto timeline = chronicle::TimelineManager::open(*store_, config, &sink_);
    if (!timeline) throw std::runtime_error("open timeline: " + timeline.error().message);
    timeline_.emplace(std::move(*timeline));
}

std::int64_t TimelineFixture::insert(const event_spec& spec) {
    auto id = timeline_->insert_event(spec.to_insert());
    if (!id) throw std::runtime_error("insert_event: " + id.error().message + " / " + id.error().cause);
    return *id;
}

chronicle::ZoomParams TimelineFixture::zoom(std::int64_t start, std::int64_t end, chronicle::type_zoom_level type_zoom,
                                            chronicle::description_lod lod) {
    chronicle::ZoomParams z;
    z.range = chronicle::time_range{start, end};
    z.filter = chronicle::make_default_root_filter();
    z.type_zoom = type_zoom;
    z.lod = lod;
    return z;
}

} // namespace chronicle_test
