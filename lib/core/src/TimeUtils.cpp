#include "upifinder/core/TimeUtils.hpp"

#include <cstdio>
#include <ctime>

namespace UPIFINDER {

namespace {

bool IsLeap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int year, unsigned month) {
  static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30,
                                     31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeap(year)) {
    return 29;
  }
  return kDays[month - 1];
}

bool ParseDigits(const std::string &text, size_t pos, size_t len,
                 unsigned &out) {
  unsigned value = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  out = value;
  return true;
}

bool IsValid(const CivilTime &t) {
  if (t.month < 1 || t.month > 12) {
    return false;
  }
  if (t.day < 1 || t.day > DaysInMonth(t.year, t.month)) {
    return false;
  }
  return t.hour < 24 && t.minute < 60 && t.second < 60;
}

}  // namespace

// Howard Hinnant's days_from_civil
int64_t DaysFromCivil(int year, unsigned month, unsigned day) {
  int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int64_t SecondsSince(const CivilTime &t, const Epoch &epoch) {
  int64_t days = DaysFromCivil(t.year, t.month, t.day) -
                 DaysFromCivil(epoch.year, epoch.month, epoch.day);
  return days * 86400 + static_cast<int64_t>(t.hour) * 3600 +
         static_cast<int64_t>(t.minute) * 60 + t.second;
}

TimePoint ToTimePoint(const CivilTime &t, const Epoch &epoch) {
  return TimePoint(std::chrono::seconds(SecondsSince(t, epoch)));
}

std::optional<TimePoint> ParseCompactTimestamp(const std::string &text) {
  if (text.size() != 14) {
    return std::nullopt;
  }
  CivilTime t;
  unsigned year = 0;
  if (!ParseDigits(text, 0, 4, year) || !ParseDigits(text, 4, 2, t.month) ||
      !ParseDigits(text, 6, 2, t.day) || !ParseDigits(text, 8, 2, t.hour) ||
      !ParseDigits(text, 10, 2, t.minute) ||
      !ParseDigits(text, 12, 2, t.second)) {
    return std::nullopt;
  }
  t.year = static_cast<int>(year);
  if (!IsValid(t)) {
    return std::nullopt;
  }
  return ToTimePoint(t, kUnixEpoch);
}

std::optional<TimePoint> ParseDate(const std::string &text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  CivilTime t;
  unsigned year = 0;
  if (!ParseDigits(text, 0, 4, year) || !ParseDigits(text, 5, 2, t.month) ||
      !ParseDigits(text, 8, 2, t.day)) {
    return std::nullopt;
  }
  t.year = static_cast<int>(year);
  if (!IsValid(t)) {
    return std::nullopt;
  }
  return ToTimePoint(t, kUnixEpoch);
}

CivilTime ToCivil(TimePoint t, unsigned *day_of_year) {
  std::time_t tt = Clock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  CivilTime c;
  c.year = tm.tm_year + 1900;
  c.month = static_cast<unsigned>(tm.tm_mon + 1);
  c.day = static_cast<unsigned>(tm.tm_mday);
  c.hour = static_cast<unsigned>(tm.tm_hour);
  c.minute = static_cast<unsigned>(tm.tm_min);
  c.second = static_cast<unsigned>(tm.tm_sec);
  if (day_of_year) {
    *day_of_year = static_cast<unsigned>(tm.tm_yday + 1);
  }
  return c;
}

std::string FormatTime(TimePoint t, bool rfc3339) {
  CivilTime c = ToCivil(t);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer),
                rfc3339 ? "%04d-%02u-%02uT%02u:%02u:%02uZ"
                        : "%04d-%02u-%02u %02u:%02u:%02u",
                c.year, c.month, c.day, c.hour, c.minute, c.second);
  return buffer;
}

std::string FormatDuration(std::chrono::seconds d) {
  int64_t total = d.count();
  if (total == 0) {
    return "0s";
  }
  std::string sign;
  if (total < 0) {
    sign = "-";
    total = -total;
  }
  int64_t hours = total / 3600;
  int64_t minutes = (total % 3600) / 60;
  int64_t seconds = total % 60;

  std::string out = sign;
  if (hours > 0) {
    out += std::to_string(hours) + "h";
  }
  if (hours > 0 || minutes > 0) {
    out += std::to_string(minutes) + "m";
  }
  out += std::to_string(seconds) + "s";
  return out;
}

}  // namespace UPIFINDER
