/**
 * @file upifinder_main.cpp
 * @brief Hadock archive auditor executable
 *
 * Counts the files of an archive (walk), lists the holes in their
 * sequence counters (check), or dumps the seen ranges of every partition
 * (inspect).
 *
 * Usage:
 *   upifinder <walk|check|inspect> [options] <archive...>
 *
 * The period of time is selected with the following rules:
 *   -s + -e : walk from START to END date
 *   -s + -d : walk from START to START + DAYS
 *   -e + -d : walk from END - DAYS to END
 *   -d      : walk from TODAY - DAYS to TODAY
 *   default : walk recursively on the given path(s)
 *
 * Exit status: 0 on success, 1 when a root could not be scanned (the
 * results are still printed), 2 on a configuration error.
 *
 * Example:
 *   upifinder check -d 7 -f csv /data/images/playback/38
 */

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <upifinder/upifinder.hpp>

using namespace UPIFINDER;

namespace {

constexpr int kExitScanError = 1;
constexpr int kExitConfigError = 2;

enum class Command { Walk, Check, Inspect };

// Values given on the command line, applied over the config file
struct Overrides {
  std::optional<std::string> config_file;
  std::optional<std::string> upi;
  std::optional<std::string> start;
  std::optional<std::string> end;
  std::optional<int> period_days;
  std::optional<int64_t> min_duration_s;
  std::optional<std::string> format;
  std::optional<std::string> group_by;
  std::optional<uint32_t> concurrency;
  std::optional<std::string> log_level;
  bool keep_invalid = false;
  bool all_gaps = false;
  bool help = false;
  std::vector<std::string> paths;
};

void printUsage(const char *program) {
  std::cout << "upifinder - Hadock archive auditor\n\n";
  std::cout << "Usage: " << program
            << " <walk|check|inspect> [options] <archive...>\n\n";
  std::cout << "Commands:\n";
  std::cout << "  walk      count files per UPI (uniq, size, corrupted)\n";
  std::cout << "  check     list the missing files per UPI\n";
  std::cout << "  inspect   show the seen ranges and holes per UPI\n\n";
  std::cout << "Options:\n";
  std::cout << "  -u, --upi <UPI>          only count files for the given UPI\n";
  std::cout << "  -s, --start <DATE>       only walk days after START (YYYY-MM-DD)\n";
  std::cout << "  -e, --end <DATE>         only walk days before END (YYYY-MM-DD)\n";
  std::cout << "  -d, --days <DAYS>        only walk a period of DAYS\n";
  std::cout << "  -i, --interval <SEC>     only report gaps lasting at least SEC seconds\n";
  std::cout << "  -f, --format <FORMAT>    column, csv, json or summary\n";
  std::cout << "  -g, --group <BY>         partition by upi (default) or source\n";
  std::cout << "  -k, --keep-invalid       use corrupted files to detect gaps\n";
  std::cout << "  -a, --all                report every gap, even refilled ones\n";
  std::cout << "  -j, --jobs <N>           archives walked at the same time\n";
  std::cout << "  -c, --config <FILE>      JSON configuration file\n";
  std::cout << "  -l, --log-level <LEVEL>  debug, info, warning or error\n";
  std::cout << "  -h, --help               Show this help message\n\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " check -d 7 -f csv /data/images/playback/38\n";
}

std::optional<Command> parseCommand(const std::string &name) {
  if (name == "walk") {
    return Command::Walk;
  }
  if (name == "check") {
    return Command::Check;
  }
  if (name == "inspect") {
    return Command::Inspect;
  }
  return std::nullopt;
}

// Throws std::invalid_argument or std::out_of_range on a bad number
Status parseArguments(int argc, char *argv[], Overrides &overrides) {
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) {
        return std::string(argv[++i]);
      }
      return std::nullopt;
    };

    std::optional<std::string> v;
    if (arg == "-k" || arg == "--keep-invalid") {
      overrides.keep_invalid = true;
    } else if (arg == "-a" || arg == "--all") {
      overrides.all_gaps = true;
    } else if (arg == "-h" || arg == "--help") {
      overrides.help = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      if (!(v = value())) {
        return Err<std::monostate>(
            Error(Error::INVALID_CONFIG, "missing value for " + arg));
      }
      if (arg == "-u" || arg == "--upi") {
        overrides.upi = *v;
      } else if (arg == "-s" || arg == "--start") {
        overrides.start = *v;
      } else if (arg == "-e" || arg == "--end") {
        overrides.end = *v;
      } else if (arg == "-d" || arg == "--days") {
        overrides.period_days = std::stoi(*v);
      } else if (arg == "-i" || arg == "--interval") {
        overrides.min_duration_s = std::stoll(*v);
      } else if (arg == "-f" || arg == "--format") {
        overrides.format = *v;
      } else if (arg == "-g" || arg == "--group") {
        overrides.group_by = *v;
      } else if (arg == "-j" || arg == "--jobs") {
        long jobs = std::stol(*v);
        if (jobs < 0 || jobs > UINT32_MAX) {
          throw std::out_of_range("jobs");
        }
        overrides.concurrency = static_cast<uint32_t>(jobs);
      } else if (arg == "-c" || arg == "--config") {
        overrides.config_file = *v;
      } else if (arg == "-l" || arg == "--log-level") {
        overrides.log_level = *v;
      } else {
        return Err<std::monostate>(
            Error(Error::INVALID_CONFIG, "unknown option " + arg));
      }
    } else {
      overrides.paths.push_back(arg);
    }
  }
  return Ok();
}

void applyOverrides(const Overrides &o, AuditConfig &config) {
  if (!o.paths.empty()) config.paths = o.paths;
  if (o.upi) config.upi = *o.upi;
  if (o.start) config.start = *o.start;
  if (o.end) config.end = *o.end;
  if (o.period_days) config.period_days = *o.period_days;
  if (o.min_duration_s) config.min_duration_s = *o.min_duration_s;
  if (o.format) config.format = *o.format;
  if (o.group_by) config.group_by = *o.group_by;
  if (o.concurrency) config.concurrency = *o.concurrency;
  if (o.log_level) config.log_level = *o.log_level;
  if (o.keep_invalid) config.keep_invalid = true;
  if (o.all_gaps) config.all_gaps = true;
}

Result<Archive::DateWindow> makeWindow(const AuditConfig &config) {
  Archive::DateWindow window;
  window.period_days = config.period_days;
  if (!config.start.empty()) {
    window.start = ParseDate(config.start);
  }
  if (!config.end.empty()) {
    window.end = ParseDate(config.end);
  }
  if ((!config.start.empty() && !window.start) ||
      (!config.end.empty() && !window.end)) {
    return Err<Archive::DateWindow>(
        Error(Error::INVALID_FORMAT, "invalid date"));
  }
  return Ok(std::move(window));
}

int configError(const Error &error) {
  std::cerr << "ERROR: " << error.message << std::endl;
  return kExitConfigError;
}

}  // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return kExitConfigError;
  }
  std::string name = argv[1];
  if (name == "-h" || name == "--help") {
    printUsage(argv[0]);
    return 0;
  }
  auto command = parseCommand(name);
  if (!command) {
    std::cerr << "ERROR: unknown command " << name << std::endl;
    printUsage(argv[0]);
    return kExitConfigError;
  }

  // Parse command line arguments
  Overrides overrides;
  try {
    auto parsed = parseArguments(argc, argv, overrides);
    if (!isOk(parsed)) {
      return configError(getError(parsed));
    }
  } catch (const std::logic_error &e) {
    return configError(Error(Error::INVALID_CONFIG,
                             std::string("invalid number: ") + e.what()));
  }
  if (overrides.help) {
    printUsage(argv[0]);
    return 0;
  }

  AuditConfig config;
  if (overrides.config_file) {
    auto loaded = LoadAuditConfigFromFile(*overrides.config_file);
    if (!isOk(loaded)) {
      return configError(getError(loaded));
    }
    config = getValue(loaded);
  }
  applyOverrides(overrides, config);

  auto valid = ValidateAuditConfig(config);
  if (!isOk(valid)) {
    return configError(getError(valid));
  }
  if (config.paths.empty()) {
    std::cerr << "ERROR: no archive given" << std::endl;
    printUsage(argv[0]);
    return kExitConfigError;
  }

  if (!Logger::Initialize(*ParseLogLevel(config.log_level), config.log_file)) {
    return configError(Error(Error::SYSTEM_ERROR,
                             "cannot open log file " + config.log_file));
  }
  auto log = Logger::GetLogger("upifinder");

  auto format = getValue(ParseOutputFormat(config.format));
  auto group = getValue(ParseGroupBy(config.group_by));

  auto window = makeWindow(config);
  if (!isOk(window)) {
    return configError(getError(window));
  }
  auto roots = Archive::ExpandRoots(config.paths, getValue(window));
  if (!isOk(roots)) {
    return configError(getError(roots));
  }

  Archive::ScanOptions options;
  options.upi = config.upi;
  options.concurrency =
      config.concurrency.value_or(*command == Command::Check ? 1 : 8);

  Report::RunInfo info;
  info.paths = getValue(roots);

  Archive::ArchiveScanner scanner(options);
  auto queue = scanner.Start(info.paths);

  Status report = Ok();
  if (*command == Command::Check) {
    Audit::GapOptions gapOptions;
    gapOptions.keep_invalid = config.keep_invalid;
    gapOptions.all_gaps = config.all_gaps;
    gapOptions.min_duration = std::chrono::seconds(config.min_duration_s);
    gapOptions.partition = MakePartitionFunc(group);

    Audit::GapDetector detector(gapOptions);
    uint64_t consumed = detector.Consume(*queue);
    log->Debug("%llu record(s) checked", static_cast<unsigned long long>(consumed));
    report = Report::WriteCheckReport(std::cout, std::cerr, detector, format, info);
  } else {
    Audit::Aggregator aggregator(MakePartitionFunc(group));
    uint64_t consumed = aggregator.Consume(*queue);
    log->Debug("%llu record(s) counted", static_cast<unsigned long long>(consumed));
    if (*command == Command::Inspect) {
      Report::WriteInspectReport(std::cout, aggregator.GetResults());
    } else {
      report = Report::WriteWalkReport(std::cout, std::cerr, aggregator, format, info);
    }
  }

  auto scanned = scanner.Wait();
  int exitCode = 0;
  if (!isOk(report)) {
    log->Error(getError(report).message);
    exitCode = kExitScanError;
  }
  if (!isOk(scanned)) {
    const auto errors = scanner.GetErrors();
    std::cerr << "ERROR: " << getError(scanned).message;
    if (errors.size() > 1) {
      std::cerr << " (and " << errors.size() - 1 << " more)";
    }
    std::cerr << std::endl;
    exitCode = kExitScanError;
  }
  Logger::GetLogger("upifinder")->Flush();
  return exitCode;
}
