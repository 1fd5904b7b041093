#include "chronicle/core/Date.hh"

#include <charconv>
#include <cstdio>
#include <limits>

namespace chronicle {

namespace {

bool readField(std::string_view& text, int& out, bool last) {
    auto dot = text.find('.');
    if (last == (dot != std::string_view::npos)) {
        return false;
    }
    std::string_view field = last ? text : text.substr(0, dot);
    if (field.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    if (ec != std::errc() || ptr != field.data() + field.size()) {
        return false;
    }
    text = last ? std::string_view() : text.substr(dot + 1);
    return true;
}

// Floor division, so negative day indices map back to dates before the epoch.
Day floorDiv(Day a, Day b) {
    Day q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace

std::optional<Day> dateToDays(std::string_view date) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (!readField(date, year, false) || !readField(date, month, false) || !readField(date, day, true)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > kDaysPerMonth) {
        return std::nullopt;
    }
    std::int64_t days = (static_cast<std::int64_t>(year) - kEpochYear) * kDaysPerYear +
                        static_cast<std::int64_t>(month - 1) * kDaysPerMonth + (day - 1);
    if (days < std::numeric_limits<Day>::min() || days > std::numeric_limits<Day>::max()) {
        return std::nullopt;
    }
    return static_cast<Day>(days);
}

std::string daysToDate(Day days) {
    Day year = kEpochYear + floorDiv(days, kDaysPerYear);
    Day withinYear = days - floorDiv(days, kDaysPerYear) * kDaysPerYear;
    Day month = 1 + withinYear / kDaysPerMonth;
    Day day = 1 + withinYear % kDaysPerMonth;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d.%02d.%02d", static_cast<int>(year), static_cast<int>(month),
                  static_cast<int>(day));
    return buffer;
}

} // namespace chronicle
