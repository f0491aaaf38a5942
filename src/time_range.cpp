#include "chronicle/time_range.hpp"

#include <chrono>

namespace chronicle {

namespace {

using std::chrono::days;
using std::chrono::floor;
using std::chrono::seconds;
using std::chrono::sys_days;
using std::chrono::year_month_day;

constexpr std::int64_t kMinute = 60;
constexpr std::int64_t kHour = 60 * kMinute;
constexpr std::int64_t kDay = 24 * kHour;

struct civil_time {
    year_month_day date;
    std::int64_t second_of_day;
};

auto to_civil(std::int64_t t) -> civil_time {
    const auto tp = std::chrono::sys_seconds{seconds{t}};
    const auto day = floor<days>(tp);
    return civil_time{year_month_day{day}, (tp - day).count()};
}

auto from_civil(const year_month_day& date, std::int64_t second_of_day) -> std::int64_t {
    return sys_days{date}.time_since_epoch().count() * kDay + second_of_day;
}

auto floor_div(std::int64_t a, std::int64_t b) -> std::int64_t {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

auto to_string(time_unit unit) -> std::string_view {
    switch (unit) {
        case time_unit::years: return "years";
        case time_unit::months: return "months";
        case time_unit::days: return "days";
        case time_unit::hours: return "hours";
        case time_unit::minutes: return "minutes";
        case time_unit::seconds: return "seconds";
    }
    return "seconds";
}

auto truncate(std::int64_t t, time_unit unit) -> std::int64_t {
    switch (unit) {
        case time_unit::years: {
            const auto c = to_civil(t);
            return from_civil(year_month_day{c.date.year(), std::chrono::January, std::chrono::day{1}}, 0);
        }
        case time_unit::months: {
            const auto c = to_civil(t);
            return from_civil(year_month_day{c.date.year(), c.date.month(), std::chrono::day{1}}, 0);
        }
        case time_unit::days: return floor_div(t, kDay) * kDay;
        case time_unit::hours: return floor_div(t, kHour) * kHour;
        case time_unit::minutes: return floor_div(t, kMinute) * kMinute;
        case time_unit::seconds: return t;
    }
    return t;
}

auto add_units(std::int64_t t, time_unit unit, std::int64_t n) -> std::int64_t {
    switch (unit) {
        case time_unit::years:
        case time_unit::months: {
            const auto c = to_civil(t);
            const std::int64_t months = unit == time_unit::years ? n * 12 : n;
            const auto ym = std::chrono::year_month{c.date.year(), c.date.month()} +
                            std::chrono::months{months};
            const auto last = std::chrono::year_month_day_last{ym.year(), std::chrono::month_day_last{ym.month()}};
            const auto day = c.date.day() > last.day() ? last.day() : c.date.day();
            return from_civil(year_month_day{ym.year(), ym.month(), day}, c.second_of_day);
        }
        case time_unit::days: return t + n * kDay;
        case time_unit::hours: return t + n * kHour;
        case time_unit::minutes: return t + n * kMinute;
        case time_unit::seconds: return t + n;
    }
    return t + n;
}

auto period_seconds_from(std::int64_t from, time_unit unit) -> std::int64_t {
    return add_units(from, unit, 1) - from;
}

auto whole_months_between(std::int64_t from, std::int64_t to) -> std::int64_t {
    if (to <= from) return 0;
    const auto a = to_civil(from).date;
    const auto b = to_civil(to).date;
    std::int64_t months = (static_cast<int>(b.year()) - static_cast<int>(a.year())) * 12 +
                          (static_cast<int>(static_cast<unsigned>(b.month())) -
                           static_cast<int>(static_cast<unsigned>(a.month())));
    while (months > 0 && add_units(from, time_unit::months, months) > to) --months;
    return months;
}

auto divide_range(const time_range& range) -> RangeDivision {
    const auto r = range.widened();
    const std::int64_t span = r.duration();
    const std::int64_t months = whole_months_between(r.start, r.end);

    time_unit unit = time_unit::seconds;
    if (months / 12 > 3) {
        unit = time_unit::years;
    } else if (months > 3) {
        unit = time_unit::months;
    } else if (span / kDay > 3) {
        unit = time_unit::days;
    } else if (span / kHour > 3) {
        unit = time_unit::hours;
    } else if (span / kMinute > 3) {
        unit = time_unit::minutes;
    }

    RangeDivision out;
    out.period_size = unit;
    out.aligned.start = truncate(r.start, unit);
    const std::int64_t last_block = truncate(r.end - 1, unit);
    out.aligned.end = add_units(last_block, unit, 1);
    switch (unit) {
        case time_unit::years:
            out.block_count = whole_months_between(out.aligned.start, out.aligned.end) / 12;
            break;
        case time_unit::months:
            out.block_count = whole_months_between(out.aligned.start, out.aligned.end);
            break;
        default:
            out.block_count = out.aligned.duration() / period_seconds_from(out.aligned.start, unit);
            break;
    }
    return out;
}

} // namespace chronicle
