#include "chronicle/event_type.hpp"

#include <array>

namespace chronicle {

namespace {

using namespace event_types;

constexpr event_type root_type{root_event_type, "ROOT_EVENT_TYPE", "Event Types", type_level::root, root_event_type};

constexpr std::array<event_type, 21> kTypes{{
    {file_system, "FILE_SYSTEM", "File System", type_level::base, root_event_type},
    {file_modified, "FILE_MODIFIED", "File Modified", type_level::sub, file_system},
    {file_accessed, "FILE_ACCESSED", "File Accessed", type_level::sub, file_system},
    {file_created, "FILE_CREATED", "File Created", type_level::sub, file_system},
    {file_changed, "FILE_CHANGED", "File Changed", type_level::sub, file_system},
    {web_activity, "WEB_ACTIVITY", "Web Activity", type_level::base, root_event_type},
    {web_downloads, "WEB_DOWNLOADS", "Web Downloads", type_level::sub, web_activity},
    {web_cookie, "WEB_COOKIE", "Web Cookies", type_level::sub, web_activity},
    {web_bookmark, "WEB_BOOKMARK", "Web Bookmarks", type_level::sub, web_activity},
    {web_history, "WEB_HISTORY", "Web History", type_level::sub, web_activity},
    {web_search, "WEB_SEARCH", "Web Searches", type_level::sub, web_activity},
    {misc_types, "MISC_TYPES", "Misc Types", type_level::base, root_event_type},
    {message, "MESSAGE", "Messages", type_level::sub, misc_types},
    {gps_route, "GPS_ROUTE", "GPS Routes", type_level::sub, misc_types},
    {gps_trackpoint, "GPS_TRACKPOINT", "Location History", type_level::sub, misc_types},
    {call_log, "CALL_LOG", "Calls", type_level::sub, misc_types},
    {email, "EMAIL", "Email", type_level::sub, misc_types},
    {recent_documents, "RECENT_DOCUMENTS", "Recent Documents", type_level::sub, misc_types},
    {installed_programs, "INSTALLED_PROGRAMS", "Installed Programs", type_level::sub, misc_types},
    {exif, "EXIF", "Exif", type_level::sub, misc_types},
    {devices_attached, "DEVICES_ATTACHED", "Devices Attached", type_level::sub, misc_types},
}};

constexpr std::array<event_type_id, 3> kBaseTypes{file_system, web_activity, misc_types};

} // namespace

auto all_event_types() -> std::span<const event_type> { return kTypes; }

auto find_event_type(event_type_id id) -> const event_type* {
    if (id == root_event_type) return &root_type;
    if (id < 0 || static_cast<std::size_t>(id) >= kTypes.size()) return nullptr;
    return &kTypes[static_cast<std::size_t>(id)];
}

auto is_known_type(event_type_id id) -> bool { return find_event_type(id) != nullptr; }

auto child_types(event_type_id id) -> std::vector<event_type_id> {
    std::vector<event_type_id> out;
    for (const auto& t : kTypes) {
        if (t.parent == id && t.id != id) out.push_back(t.id);
    }
    return out;
}

auto base_ordinal(event_type_id id) -> std::optional<std::int32_t> {
    const auto* t = find_event_type(id);
    if (t == nullptr || t->level == type_level::root) return std::nullopt;
    const event_type_id base = t->level == type_level::base ? t->id : t->parent;
    for (std::size_t i = 0; i < kBaseTypes.size(); ++i) {
        if (kBaseTypes[i] == base) return static_cast<std::int32_t>(i);
    }
    return std::nullopt;
}

auto base_type_for_ordinal(std::int32_t ordinal) -> std::optional<event_type_id> {
    if (ordinal < 0 || static_cast<std::size_t>(ordinal) >= kBaseTypes.size()) return std::nullopt;
    return kBaseTypes[static_cast<std::size_t>(ordinal)];
}

auto type_at_zoom(event_type_id id, type_zoom_level zoom) -> event_type_id {
    const auto* t = find_event_type(id);
    if (t == nullptr || zoom == type_zoom_level::sub_type || t->level != type_level::sub) return id;
    return t->parent;
}

} // namespace chronicle
