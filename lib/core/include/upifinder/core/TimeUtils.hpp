#ifndef UPIFINDER_CORE_TIME_UTILS_HPP
#define UPIFINDER_CORE_TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace UPIFINDER {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Calendar date of a clock origin, always UTC midnight
 */
struct Epoch {
  int year;
  unsigned month;
  unsigned day;
};

constexpr Epoch kUnixEpoch{1970, 1, 1};
constexpr Epoch kGPSEpoch{1980, 1, 6};

/**
 * @brief Broken-down UTC time
 */
struct CivilTime {
  int year = 1970;
  unsigned month = 1;
  unsigned day = 1;
  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;
};

/**
 * @brief Days between 1970-01-01 and the given proleptic Gregorian date
 */
int64_t DaysFromCivil(int year, unsigned month, unsigned day);

/**
 * @brief Seconds elapsed from the epoch to the civil time
 *
 * Negative when the time lies before the epoch.
 */
int64_t SecondsSince(const CivilTime &t, const Epoch &epoch);

/**
 * @brief Convert a civil UTC time to a system clock time point
 * @param epoch Origin of the system clock (kUnixEpoch on every supported platform)
 */
TimePoint ToTimePoint(const CivilTime &t, const Epoch &epoch = kUnixEpoch);

/**
 * @brief Parse "YYYYMMDDhhmmss" (fourteen digits, UTC)
 * @return nullopt on wrong length, non-digit or out-of-range field
 */
std::optional<TimePoint> ParseCompactTimestamp(const std::string &text);

/**
 * @brief Parse "YYYY-MM-DD" (UTC midnight)
 */
std::optional<TimePoint> ParseDate(const std::string &text);

/**
 * @brief Break a time point down to UTC fields plus day of year (1-366)
 */
CivilTime ToCivil(TimePoint t, unsigned *day_of_year = nullptr);

/**
 * @brief "YYYY-MM-DD hh:mm:ss", or RFC 3339 ("YYYY-MM-DDThh:mm:ssZ")
 */
std::string FormatTime(TimePoint t, bool rfc3339 = false);

/**
 * @brief Human readable duration such as "1h2m3s", "45s" or "-10s"
 */
std::string FormatDuration(std::chrono::seconds d);

}  // namespace UPIFINDER

#endif  // UPIFINDER_CORE_TIME_UTILS_HPP
