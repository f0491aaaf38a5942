#pragma once

/** \file event.hpp
 *  \brief The persisted event record and the secondary facts attached to it.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "chronicle/event_type.hpp"

namespace chronicle {

/** \brief Known-file classification, stored as its numeric value. */
enum class known_state : std::int32_t { unknown = 0, known = 1, bad = 2 };

/** \brief Description level of detail, most detailed first. */
enum class description_lod : std::uint8_t { full, medium, short_form };

auto to_string(description_lod lod) -> std::string_view;

struct tag_name {
    std::int64_t id{0};
    std::string display_name;
};

/** \brief One application of a tag name to a piece of content or an artifact. */
struct Tag {
    std::int64_t id{0};
    tag_name name;
};

/** \brief An event as stored. Immutable once read. */
struct Event {
    std::int64_t event_id{0};
    std::int64_t data_source_id{0};
    std::int64_t file_id{0};
    std::optional<std::int64_t> artifact_id;  /**< nullopt for content-derived events */
    std::int64_t time{0};
    event_type_id type{0};
    std::string full_description;
    std::string med_description;
    std::string short_description;
    known_state known{known_state::unknown};
    bool hash_hit{false};
    bool tagged{false};

    [[nodiscard]] auto description(description_lod lod) const -> const std::string&;
};

/** \brief Everything needed to insert one event and its secondary facts. */
struct EventInsert {
    std::int64_t time{0};
    event_type_id type{0};
    std::int64_t data_source_id{0};
    std::int64_t file_id{0};
    std::optional<std::int64_t> artifact_id;
    std::string full_description;
    std::string med_description;
    std::string short_description;
    known_state known{known_state::unknown};
    std::set<std::string> hash_set_names;
    std::vector<Tag> tags;
};

/**
 * \brief Events sharing (time, full description, file id), e.g. the MACB
 * timestamps of one file at one instant.
 */
struct CombinedEvent {
    std::int64_t time{0};
    std::string description;
    std::int64_t file_id{0};
    std::map<event_type_id, std::int64_t> events_by_type;

    /** \brief Id of the first contributing event in type order. */
    [[nodiscard]] auto representative_event_id() const -> std::optional<std::int64_t> {
        if (events_by_type.empty()) return std::nullopt;
        return events_by_type.begin()->second;
    }
};

} // namespace chronicle
