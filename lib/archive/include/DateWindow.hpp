#ifndef UPIFINDER_ARCHIVE_DATE_WINDOW_HPP
#define UPIFINDER_ARCHIVE_DATE_WINDOW_HPP

#include <optional>
#include <string>
#include <vector>

#include "upifinder/core/Error.hpp"
#include "upifinder/core/TimeUtils.hpp"

namespace UPIFINDER {
namespace Archive {

/**
 * @brief Days of the archive to scan
 *
 * The window is resolved from the values that are set:
 *   start + end    : [start, end)
 *   start + period : [start, start + period days)
 *   end + period   : [end - period days, end)
 *   period         : [now - period days, now)
 *   anything else  : no window, roots are scanned recursively as given
 * start + end + period is a configuration error.
 */
struct DateWindow {
  int period_days = 0;
  std::optional<TimePoint> start;
  std::optional<TimePoint> end;
};

/**
 * @brief Expand archive roots into one "<root>/YYYY/DDD" path per day
 *
 * Days are iterated in the outer loop, roots in the inner loop.
 * @param now Reference time for a period without start or end
 */
Result<std::vector<std::string>> ExpandRoots(
    const std::vector<std::string> &roots, const DateWindow &window,
    TimePoint now = Clock::now());

/**
 * @brief "<root>/YYYY/DDD" for the UTC day containing t
 */
std::string DayPath(const std::string &root, TimePoint t);

}  // namespace Archive
}  // namespace UPIFINDER

#endif  // UPIFINDER_ARCHIVE_DATE_WINDOW_HPP
