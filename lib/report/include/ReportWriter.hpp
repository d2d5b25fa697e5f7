/**
 * @file ReportWriter.hpp
 * @brief Rendering of walk, check and inspect results
 */

#ifndef UPIFINDER_REPORT_REPORT_WRITER_HPP
#define UPIFINDER_REPORT_REPORT_WRITER_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

#include "Aggregator.hpp"
#include "GapDetector.hpp"
#include "upifinder/core/AuditConfig.hpp"
#include "upifinder/core/Error.hpp"
#include "upifinder/core/Record.hpp"

namespace UPIFINDER {

void to_json(nlohmann::ordered_json &j, const Gap &gap);

namespace Audit {
void to_json(nlohmann::ordered_json &j, const Coze &coze);
}  // namespace Audit

namespace Report {

/**
 * @brief Context printed with JSON reports
 */
struct RunInfo {
  TimePoint when = Clock::now();
  std::vector<std::string> paths;  ///< Roots after date expansion
};

/**
 * @brief Replace every character other than letters, digits, '-', '_'
 * and '/' by '*'
 */
std::string Transform(const std::string &upi);

/**
 * @brief Size with a binary unit, e.g. "  1.50KB" or "   512B"
 */
std::string PrettySize(uint64_t bytes);

/**
 * @brief Quote a CSV field when it holds a comma, quote or line break
 */
std::string EscapeCSV(const std::string &field);

// === walk ===

/**
 * @brief "<count> files found (<MB>MB) - uniq: <n> - corrupted: <n> (<pct>%)"
 */
std::string WalkSummary(const Audit::Coze &total);

void WriteWalkColumns(std::ostream &out,
                      const std::map<std::string, Audit::Coze> &results);
void WriteWalkCSV(std::ostream &out,
                  const std::map<std::string, Audit::Coze> &results);
nlohmann::ordered_json WalkToJSON(const std::map<std::string, Audit::Coze> &results,
                          const RunInfo &info);

/**
 * @brief Render the aggregates in the requested format
 *
 * Tables, CSV and JSON go to out; the summary line goes to summary.
 * Nothing is written when there are no results.
 */
Status WriteWalkReport(std::ostream &out, std::ostream &summary,
                       const Audit::Aggregator &aggregator,
                       OutputFormat format, const RunInfo &info);

// === check ===

/**
 * @brief "<missing> missing files (<duration>)"
 */
std::string CheckSummary(uint64_t missing, std::chrono::seconds elapsed);

void WriteGapColumns(std::ostream &out, const std::vector<Gap> &gaps);
void WriteGapCSV(std::ostream &out, const std::vector<Gap> &gaps);
nlohmann::ordered_json GapsToJSON(const std::vector<Gap> &gaps, const RunInfo &info);

Status WriteCheckReport(std::ostream &out, std::ostream &summary,
                        const Audit::GapDetector &detector,
                        OutputFormat format, const RunInfo &info);

// === inspect ===

/**
 * @brief Per partition: time bounds, size, sequence span, ranges and holes
 *
 * Partitions are separated by a "===" line.
 */
void WriteInspectReport(std::ostream &out,
                        const std::map<std::string, Audit::Coze> &results);

}  // namespace Report
}  // namespace UPIFINDER

#endif  // UPIFINDER_REPORT_REPORT_WRITER_HPP
