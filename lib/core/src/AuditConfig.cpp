#include "upifinder/core/AuditConfig.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

#include "upifinder/core/Logger.hpp"
#include "upifinder/core/TimeUtils.hpp"

namespace UPIFINDER {

namespace {

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

}  // namespace

Result<OutputFormat> ParseOutputFormat(const std::string &text) {
  std::string f = ToLower(text);
  if (f.empty()) {
    return Ok(OutputFormat::Default);
  }
  if (f == "column") {
    return Ok(OutputFormat::Column);
  }
  if (f == "csv") {
    return Ok(OutputFormat::CSV);
  }
  if (f == "json") {
    return Ok(OutputFormat::JSON);
  }
  if (f == "summary") {
    return Ok(OutputFormat::Summary);
  }
  return Err<OutputFormat>(
      Error(Error::INVALID_FORMAT, "unsupported format: " + text));
}

Result<GroupBy> ParseGroupBy(const std::string &text) {
  std::string g = ToLower(text);
  if (g.empty() || g == "upi") {
    return Ok(GroupBy::UPI);
  }
  if (g == "source") {
    return Ok(GroupBy::Source);
  }
  return Err<GroupBy>(
      Error(Error::INVALID_CONFIG, "invalid group-by selector: " + text));
}

Result<AuditConfig> AuditConfigFromJSON(const nlohmann::json &config,
                                        AuditConfig base) {
  if (!config.is_object()) {
    return Err<AuditConfig>(
        Error(Error::INVALID_CONFIG, "configuration must be a JSON object"));
  }
  try {
    if (config.contains("paths")) {
      base.paths = config["paths"].get<std::vector<std::string>>();
    }
    if (config.contains("upi")) {
      base.upi = config["upi"].get<std::string>();
    }
    if (config.contains("period_days")) {
      base.period_days = config["period_days"].get<int>();
    }
    if (config.contains("start")) {
      base.start = config["start"].get<std::string>();
    }
    if (config.contains("end")) {
      base.end = config["end"].get<std::string>();
    }
    if (config.contains("min_duration_s")) {
      base.min_duration_s = config["min_duration_s"].get<int64_t>();
    }
    if (config.contains("keep_invalid")) {
      base.keep_invalid = config["keep_invalid"].get<bool>();
    }
    if (config.contains("all_gaps")) {
      base.all_gaps = config["all_gaps"].get<bool>();
    }
    if (config.contains("group_by")) {
      base.group_by = config["group_by"].get<std::string>();
    }
    if (config.contains("format")) {
      base.format = config["format"].get<std::string>();
    }
    if (config.contains("concurrency")) {
      base.concurrency = config["concurrency"].get<uint32_t>();
    }
    if (config.contains("log_level")) {
      base.log_level = config["log_level"].get<std::string>();
    }
    if (config.contains("log_file")) {
      base.log_file = config["log_file"].get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    return Err<AuditConfig>(Error(Error::INVALID_CONFIG,
                                  std::string("bad configuration value: ") +
                                      e.what()));
  }
  return Ok(std::move(base));
}

Result<AuditConfig> LoadAuditConfigFromFile(const std::string &filename,
                                            AuditConfig base) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    return Err<AuditConfig>(
        Error(Error::NOT_FOUND, "cannot open configuration file " + filename));
  }

  std::string file_content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
  if (file_content.empty()) {
    return Err<AuditConfig>(
        Error(Error::INVALID_CONFIG, "empty configuration file " + filename));
  }

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(file_content);
  } catch (const nlohmann::json::parse_error &e) {
    return Err<AuditConfig>(Error(Error::INVALID_CONFIG,
                                  filename + ": " + std::string(e.what())));
  }
  return AuditConfigFromJSON(config, std::move(base));
}

Status ValidateAuditConfig(const AuditConfig &config) {
  if (config.period_days < 0) {
    return Err<std::monostate>(
        Error(Error::INVALID_CONFIG, "period can't be negative"));
  }
  if (config.period_days > 0 && !config.start.empty() && !config.end.empty()) {
    return Err<std::monostate>(
        Error(Error::INVALID_CONFIG,
              "period can't be set if start and end dates are provided"));
  }

  std::optional<TimePoint> start;
  std::optional<TimePoint> end;
  if (!config.start.empty() && !(start = ParseDate(config.start))) {
    return Err<std::monostate>(
        Error(Error::INVALID_FORMAT, "invalid start date: " + config.start));
  }
  if (!config.end.empty() && !(end = ParseDate(config.end))) {
    return Err<std::monostate>(
        Error(Error::INVALID_FORMAT, "invalid end date: " + config.end));
  }
  if (start && end && *end < *start) {
    return Err<std::monostate>(
        Error(Error::INVALID_CONFIG, "end date before start date"));
  }

  if (config.min_duration_s < 0) {
    return Err<std::monostate>(
        Error(Error::INVALID_CONFIG, "minimum gap duration can't be negative"));
  }

  auto group = ParseGroupBy(config.group_by);
  if (!isOk(group)) {
    return Err<std::monostate>(Error(getError(group)));
  }
  auto format = ParseOutputFormat(config.format);
  if (!isOk(format)) {
    return Err<std::monostate>(Error(getError(format)));
  }

  if (config.concurrency && *config.concurrency == 0) {
    return Err<std::monostate>(
        Error(Error::INVALID_CONFIG, "concurrency must be at least 1"));
  }
  if (!ParseLogLevel(config.log_level)) {
    return Err<std::monostate>(
        Error(Error::INVALID_CONFIG, "unknown log level: " + config.log_level));
  }
  return Ok();
}

}  // namespace UPIFINDER
