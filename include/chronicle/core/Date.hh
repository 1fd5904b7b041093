#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle {

// Simulation time as a day index: 360-day years of twelve 30-day months,
// counted from 2200.01.01.
using Day = std::int32_t;

inline constexpr int kEpochYear = 2200;
inline constexpr Day kDaysPerYear = 360;
inline constexpr Day kDaysPerMonth = 30;

// "Y.M.D" -> day index. nullopt unless the text has three numeric fields,
// a month in 1..12, a day in 1..30 and a result that fits a Day.
std::optional<Day> dateToDays(std::string_view date);

// Inverse of dateToDays, formatted "YYYY.MM.DD".
std::string daysToDate(Day days);

constexpr Day daysFromYmd(int year, int month, int day) {
    return (year - kEpochYear) * kDaysPerYear + (month - 1) * kDaysPerMonth + (day - 1);
}

} // namespace chronicle
