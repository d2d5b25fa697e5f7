#include "DateWindow.hpp"

#include <cstdio>
#include <filesystem>

namespace UPIFINDER {
namespace Archive {

namespace {
constexpr std::chrono::hours kDay{24};
}

std::string DayPath(const std::string &root, TimePoint t) {
  unsigned yday = 0;
  CivilTime c = ToCivil(t, &yday);

  char year[8];
  char day[8];
  std::snprintf(year, sizeof(year), "%04d", c.year);
  std::snprintf(day, sizeof(day), "%03u", yday);
  return (std::filesystem::path(root) / year / day).lexically_normal().string();
}

Result<std::vector<std::string>> ExpandRoots(
    const std::vector<std::string> &roots, const DateWindow &window,
    TimePoint now) {
  using Paths = std::vector<std::string>;

  const int period = window.period_days;
  if (period > 0 && window.start && window.end) {
    return Err<Paths>(
        Error(Error::INVALID_CONFIG,
              "period can't be set if start and end dates are provided"));
  }

  TimePoint dtstart;
  TimePoint dtend;
  if (window.start && window.end) {
    dtstart = *window.start;
    dtend = *window.end;
  } else if (period > 0 && window.start) {
    dtstart = *window.start;
    dtend = dtstart + kDay * period;
  } else if (period > 0 && window.end) {
    dtend = *window.end;
    dtstart = dtend - kDay * period;
  } else if (period > 0) {
    dtend = now;
    dtstart = dtend - kDay * period;
  } else {
    Paths copy(roots);
    return Ok(std::move(copy));
  }

  Paths paths;
  for (; dtstart < dtend; dtstart += kDay) {
    for (const auto &root : roots) {
      paths.push_back(DayPath(root, dtstart));
    }
  }
  return Ok(std::move(paths));
}

}  // namespace Archive
}  // namespace UPIFINDER
