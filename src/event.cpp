#include "chronicle/event.hpp"

namespace chronicle {

auto to_string(description_lod lod) -> std::string_view {
    switch (lod) {
        case description_lod::full: return "full";
        case description_lod::medium: return "medium";
        case description_lod::short_form: return "short";
    }
    return "short";
}

auto Event::description(description_lod lod) const -> const std::string& {
    switch (lod) {
        case description_lod::full: return full_description;
        case description_lod::medium: return med_description;
        case description_lod::short_form: return short_description;
    }
    return short_description;
}

} // namespace chronicle
