#pragma once

/** \file event_type.hpp
 *  \brief The fixed two-level event type hierarchy.
 *
 * Ids are the pre-order index of a type in the flattened hierarchy (base types
 * included) and are what the events table stores in sub_type. The base type's
 * ordinal (0..2) is what it stores in base_type. The root has no stored id.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace chronicle {

using event_type_id = std::int32_t;

inline constexpr event_type_id root_event_type = -1;

enum class type_level : std::uint8_t { root, base, sub };

/** \brief Granularity at which event types are grouped. */
enum class type_zoom_level : std::uint8_t { base_type, sub_type };

struct event_type {
    event_type_id id;
    std::string_view name;
    std::string_view display_name;
    type_level level;
    event_type_id parent; /**< root_event_type for base types */
};

namespace event_types {

inline constexpr event_type_id file_system = 0;
inline constexpr event_type_id file_modified = 1;
inline constexpr event_type_id file_accessed = 2;
inline constexpr event_type_id file_created = 3;
inline constexpr event_type_id file_changed = 4;
inline constexpr event_type_id web_activity = 5;
inline constexpr event_type_id web_downloads = 6;
inline constexpr event_type_id web_cookie = 7;
inline constexpr event_type_id web_bookmark = 8;
inline constexpr event_type_id web_history = 9;
inline constexpr event_type_id web_search = 10;
inline constexpr event_type_id misc_types = 11;
inline constexpr event_type_id message = 12;
inline constexpr event_type_id gps_route = 13;
inline constexpr event_type_id gps_trackpoint = 14;
inline constexpr event_type_id call_log = 15;
inline constexpr event_type_id email = 16;
inline constexpr event_type_id recent_documents = 17;
inline constexpr event_type_id installed_programs = 18;
inline constexpr event_type_id exif = 19;
inline constexpr event_type_id devices_attached = 20;

} // namespace event_types

/** \brief All non-root types in id order. */
auto all_event_types() -> std::span<const event_type>;

/** \brief nullptr for unknown ids; the root is returned for root_event_type. */
auto find_event_type(event_type_id id) -> const event_type*;

auto is_known_type(event_type_id id) -> bool;

/** \brief Direct children, in id order. */
auto child_types(event_type_id id) -> std::vector<event_type_id>;

/** \brief Ordinal of the base type a type belongs to (stored in the base_type column). */
auto base_ordinal(event_type_id id) -> std::optional<std::int32_t>;

/** \brief Base type id for a stored base_type ordinal. */
auto base_type_for_ordinal(std::int32_t ordinal) -> std::optional<event_type_id>;

/** \brief The type that represents \p id at the requested zoom (its base, or itself). */
auto type_at_zoom(event_type_id id, type_zoom_level zoom) -> event_type_id;

} // namespace chronicle
