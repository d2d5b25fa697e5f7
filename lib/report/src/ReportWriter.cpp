/**
 * @file ReportWriter.cpp
 * @brief Implementation of the walk, check and inspect renderers
 */

#include "ReportWriter.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

#include "TableWriter.hpp"

namespace UPIFINDER {

void to_json(nlohmann::ordered_json &j, const Gap &gap) {
  j = nlohmann::ordered_json{{"upi", gap.upi},
                     {"before", gap.before},
                     {"after", gap.after},
                     {"dtstart", FormatTime(gap.starts, true)},
                     {"dtend", FormatTime(gap.ends, true)},
                     {"duration", gap.Duration().count()},
                     {"missing", gap.Count()}};
}

namespace Audit {

void to_json(nlohmann::ordered_json &j, const Coze &coze) {
  j = nlohmann::ordered_json{{"upi", coze.upi},
                     {"total", coze.count},
                     {"uniq", coze.uniq},
                     {"size", coze.size},
                     {"invalid", coze.invalid},
                     {"corrupted", coze.Corrupted()},
                     {"dtstart", FormatTime(coze.starts, true)},
                     {"dtend", FormatTime(coze.ends, true)},
                     {"first", coze.first},
                     {"last", coze.last},
                     {"missing", coze.Missing()}};
}

}  // namespace Audit

namespace Report {

namespace {

constexpr uint64_t kKilo = 1024;
constexpr uint64_t kMega = kKilo * kKilo;
constexpr uint64_t kGiga = kMega * kKilo;
constexpr uint64_t kTera = kGiga * kKilo;

std::string Percent(double ratio) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%3.2f", 100 * ratio);
  return buffer;
}

std::string Ratio(double ratio) {
  std::ostringstream oss;
  oss << ratio;
  return oss.str();
}

void WriteCSVRow(std::ostream &out, const std::vector<std::string> &row) {
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << EscapeCSV(row[i]);
  }
  out << '\n';
}

}  // namespace

std::string Transform(const std::string &upi) {
  std::string out = upi;
  for (auto &c : out) {
    unsigned char u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && c != '-' && c != '_' && c != '/') {
      c = '*';
    }
  }
  return out;
}

std::string PrettySize(uint64_t bytes) {
  const double f = static_cast<double>(bytes);
  double x = f;
  double m = 0;
  const char *unit = "B";
  if (f / kTera > 1.0) {
    x = f / kTera;
    m = std::fmod(f, static_cast<double>(kTera));
    unit = "TB";
  } else if (f / kGiga > 1.0) {
    x = f / kGiga;
    m = std::fmod(f, static_cast<double>(kGiga));
    unit = "GB";
  } else if (f / kMega > 1.0) {
    x = f / kMega;
    m = std::fmod(f, static_cast<double>(kMega));
    unit = "MB";
  } else if (f / kKilo > 1.0) {
    x = f / kKilo;
    m = std::fmod(f, static_cast<double>(kKilo));
    unit = "KB";
  }

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), m > 0 ? "%6.2f%s" : "%6.0f%s", x,
                unit);
  return buffer;
}

std::string EscapeCSV(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
  return out;
}

// === walk ===

std::string WalkSummary(const Audit::Coze &total) {
  char buffer[256];
  std::snprintf(buffer, sizeof(buffer),
                "%llu files found (%lluMB) - uniq: %llu - corrupted: %llu "
                "(%s%%)",
                static_cast<unsigned long long>(total.count),
                static_cast<unsigned long long>(total.size >> 20),
                static_cast<unsigned long long>(total.uniq),
                static_cast<unsigned long long>(total.invalid),
                Percent(total.Corrupted()).c_str());
  return buffer;
}

void WriteWalkColumns(std::ostream &out,
                      const std::map<std::string, Audit::Coze> &results) {
  TableWriter table;
  table.AddRow({"UPI", "Files", "Uniq", "Size (MB)", "Invalid", "Corrupted",
                "Starts", "Ends", "First", "Last", "Missing"});
  for (const auto &entry : results) {
    const Audit::Coze &c = entry.second;
    table.AddRow({Transform(entry.first), std::to_string(c.count),
                  std::to_string(c.uniq), std::to_string(c.size >> 20),
                  std::to_string(c.invalid), "(" + Percent(c.Corrupted()) + "%)",
                  FormatTime(c.starts), FormatTime(c.ends),
                  std::to_string(c.first), std::to_string(c.last),
                  std::to_string(c.Missing())});
  }
  table.Write(out);
}

void WriteWalkCSV(std::ostream &out,
                  const std::map<std::string, Audit::Coze> &results) {
  for (const auto &entry : results) {
    const Audit::Coze &c = entry.second;
    WriteCSVRow(out, {entry.first, std::to_string(c.count),
                      std::to_string(c.uniq), std::to_string(c.size >> 20),
                      std::to_string(c.invalid), Ratio(c.Corrupted()),
                      FormatTime(c.starts, true), FormatTime(c.ends, true),
                      std::to_string(c.first), std::to_string(c.last),
                      std::to_string(c.Missing())});
  }
}

nlohmann::ordered_json WalkToJSON(const std::map<std::string, Audit::Coze> &results,
                          const RunInfo &info) {
  nlohmann::ordered_json status = nlohmann::ordered_json::object();
  for (const auto &entry : results) {
    status[entry.first] = entry.second;
  }
  return nlohmann::ordered_json{{"dtstamp", FormatTime(info.when, true)},
                        {"dirs", info.paths},
                        {"status", status}};
}

Status WriteWalkReport(std::ostream &out, std::ostream &summary,
                       const Audit::Aggregator &aggregator,
                       OutputFormat format, const RunInfo &info) {
  const auto &results = aggregator.GetResults();
  if (results.empty()) {
    return Ok();
  }

  switch (format) {
    case OutputFormat::Default:
    case OutputFormat::Column:
      WriteWalkColumns(out, results);
      summary << '\n' << WalkSummary(aggregator.Total()) << std::endl;
      break;
    case OutputFormat::Summary:
      summary << WalkSummary(aggregator.Total()) << std::endl;
      break;
    case OutputFormat::CSV:
      WriteWalkCSV(out, results);
      break;
    case OutputFormat::JSON:
      out << WalkToJSON(results, info).dump() << std::endl;
      break;
    default:
      return Err<std::monostate>(
          Error(Error::INVALID_FORMAT, "unsupported output format"));
  }
  if (!out) {
    return Err<std::monostate>(
        Error(Error::SYSTEM_ERROR, "cannot write walk report"));
  }
  return Ok();
}

// === check ===

std::string CheckSummary(uint64_t missing, std::chrono::seconds elapsed) {
  return std::to_string(missing) + " missing files (" +
         FormatDuration(elapsed) + ")";
}

void WriteGapColumns(std::ostream &out, const std::vector<Gap> &gaps) {
  TableWriter table;
  table.AddRow(
      {"UPI", "Starts", "Ends", "Duration", "Before", "After", "Missing"});
  for (const Gap &gap : gaps) {
    table.AddRow({Transform(gap.upi), FormatTime(gap.starts),
                  FormatTime(gap.ends), FormatDuration(gap.Duration()),
                  std::to_string(gap.before), std::to_string(gap.after),
                  std::to_string(gap.Count())});
  }
  table.Write(out);
}

void WriteGapCSV(std::ostream &out, const std::vector<Gap> &gaps) {
  for (const Gap &gap : gaps) {
    WriteCSVRow(out, {gap.upi, FormatTime(gap.starts, true),
                      FormatTime(gap.ends, true),
                      FormatDuration(gap.Duration()),
                      std::to_string(gap.before), std::to_string(gap.after),
                      std::to_string(gap.Count())});
  }
}

nlohmann::ordered_json GapsToJSON(const std::vector<Gap> &gaps, const RunInfo &info) {
  nlohmann::ordered_json byUPI = nlohmann::ordered_json::object();
  uint64_t missing = 0;
  std::chrono::seconds elapsed{0};
  for (const Gap &gap : gaps) {
    byUPI[gap.upi].push_back(nlohmann::ordered_json(gap));
    missing += gap.Count();
    elapsed += gap.Duration();
  }
  return nlohmann::ordered_json{{"dtstamp", FormatTime(info.when, true)},
                        {"dirs", info.paths},
                        {"count", gaps.size()},
                        {"gaps", byUPI},
                        {"missing", missing},
                        {"duration", elapsed.count()}};
}

Status WriteCheckReport(std::ostream &out, std::ostream &summary,
                        const Audit::GapDetector &detector,
                        OutputFormat format, const RunInfo &info) {
  const std::vector<Gap> gaps = detector.GetGaps();
  if (gaps.empty()) {
    return Ok();
  }

  switch (format) {
    case OutputFormat::Default:
    case OutputFormat::Column:
      WriteGapColumns(out, gaps);
      summary << '\n'
              << CheckSummary(detector.GetMissingCount(),
                              detector.GetElapsed())
              << std::endl;
      break;
    case OutputFormat::Summary:
      summary << CheckSummary(detector.GetMissingCount(),
                              detector.GetElapsed())
              << std::endl;
      break;
    case OutputFormat::CSV:
      WriteGapCSV(out, gaps);
      break;
    case OutputFormat::JSON:
      out << GapsToJSON(gaps, info).dump() << std::endl;
      break;
    default:
      return Err<std::monostate>(
          Error(Error::INVALID_FORMAT, "unsupported output format"));
  }
  if (!out) {
    return Err<std::monostate>(
        Error(Error::SYSTEM_ERROR, "cannot write check report"));
  }
  return Ok();
}

// === inspect ===

void WriteInspectReport(std::ostream &out,
                        const std::map<std::string, Audit::Coze> &results) {
  size_t index = 0;
  for (const auto &entry : results) {
    const Audit::Coze &c = entry.second;
    const auto span = c.Range();

    out << '\n'
        << Transform(entry.first) << " (" << FormatTime(c.starts) << " - "
        << FormatTime(c.ends) << ")\n\n";
    out << "- Size  : " << PrettySize(c.size) << '\n';
    out << "- Total : " << c.ranges.Total() << '\n';
    out << "- First : " << span.first << '\n';
    out << "- Last  : " << span.second << '\n';

    const auto &ranges = c.ranges.Ranges();
    if (!ranges.empty()) {
      out << "- Ranges: " << ranges.size() << '\n';
      for (size_t i = 0; i < ranges.size(); ++i) {
        const Range &r = ranges[i];
        out << "-- " << i + 1 << ": " << r.first << " -> " << r.last
            << " (total: " << static_cast<uint64_t>(r.last) - r.first + 1
            << ")\n";
      }
    }

    const auto holes = c.ranges.MissingRanges();
    if (!holes.empty()) {
      out << "- Gaps : " << holes.size() << '\n';
      for (size_t i = 0; i < holes.size(); ++i) {
        const Range &r = holes[i];
        out << "-- " << i + 1 << ": " << r.first << " -> " << r.last
            << " (missing: " << r.last - r.first - 1 << ")\n";
      }
    }

    out << '\n';
    if (++index < results.size()) {
      out << "===\n";
    }
  }
}

}  // namespace Report
}  // namespace UPIFINDER
