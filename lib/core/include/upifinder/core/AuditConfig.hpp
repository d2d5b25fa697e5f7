#ifndef UPIFINDER_CORE_AUDIT_CONFIG_HPP
#define UPIFINDER_CORE_AUDIT_CONFIG_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "upifinder/core/Error.hpp"
#include "upifinder/core/Record.hpp"

namespace UPIFINDER {

enum class OutputFormat { Default, Column, CSV, JSON, Summary };

Result<OutputFormat> ParseOutputFormat(const std::string &text);
Result<GroupBy> ParseGroupBy(const std::string &text);

/**
 * @brief Settings of one audit run
 *
 * Loaded from a JSON file and/or filled from command line flags.
 *
 * Example JSON:
 *   {
 *     "paths": ["/data/images/playback/38"],
 *     "upi": "",
 *     "period_days": 7,
 *     "start": "2018-06-04",
 *     "end": "",
 *     "min_duration_s": 60,
 *     "keep_invalid": false,
 *     "all_gaps": false,
 *     "group_by": "upi",
 *     "format": "csv",
 *     "concurrency": 8,
 *     "log_level": "info",
 *     "log_file": ""
 *   }
 */
struct AuditConfig {
  std::vector<std::string> paths;  ///< Archive roots
  std::string upi;                 ///< UPI filter, empty for all

  // Date window, see DateWindow
  int period_days = 0;  ///< Number of days, 0 = no period
  std::string start;    ///< "YYYY-MM-DD" or empty
  std::string end;      ///< "YYYY-MM-DD" or empty

  // Gap detection
  int64_t min_duration_s = 0;  ///< Drop gaps shorter than this (0 = keep all)
  bool keep_invalid = false;   ///< Use ".bad" files for gap detection
  bool all_gaps = false;       ///< Report every gap, never refill

  std::string group_by = "upi";  ///< "upi" or "source"
  std::string format;            ///< "", "column", "csv", "json", "summary"

  std::optional<uint32_t> concurrency;  ///< Root workers, unset = command default

  std::string log_level = "info";
  std::string log_file;
};

/**
 * @brief Copy the keys present in the JSON object over base
 */
Result<AuditConfig> AuditConfigFromJSON(const nlohmann::json &config,
                                        AuditConfig base = AuditConfig{});

Result<AuditConfig> LoadAuditConfigFromFile(const std::string &filename,
                                            AuditConfig base = AuditConfig{});

/**
 * @brief Reject unusable settings before any scanning starts
 */
Status ValidateAuditConfig(const AuditConfig &config);

}  // namespace UPIFINDER

#endif  // UPIFINDER_CORE_AUDIT_CONFIG_HPP
