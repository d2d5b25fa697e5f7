#ifndef UPIFINDER_CORE_RECORD_HPP
#define UPIFINDER_CORE_RECORD_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "upifinder/core/TimeUtils.hpp"

namespace UPIFINDER {

/**
 * @brief One archived file, decoded from its name
 *
 * Immutable once produced by the RecordDecoder.
 */
struct Record {
  std::string path;    ///< Filesystem path, tar member name or list-file line
  std::string source;  ///< Source identifier, hex text without leading zeros
  std::string upi;     ///< Data product identifier (or the forced filter value)
  uint64_t size = 0;   ///< Declared byte length (0 when unknown)
  uint32_t sequence = 0;  ///< Monotonic counter within (source, upi)
  TimePoint acq_time;     ///< Acquisition time

  /**
   * @brief Files whose extension is ".bad" are corrupted
   */
  bool IsValid() const;

  /**
   * @brief "source/upi"
   */
  std::string Key() const { return source + "/" + upi; }
};

/**
 * @brief A hole in the sequence counter of one partition
 *
 * before and after are the sequence numbers of the records bounding the
 * hole; both are present, everything strictly between them is missing.
 */
struct Gap {
  std::string upi;  ///< Partition key
  uint32_t before = 0;
  uint32_t after = 0;
  TimePoint starts;  ///< Acquisition time of the record at "before"
  TimePoint ends;    ///< Acquisition time of the record at "after"

  uint32_t Count() const { return after - before - 1; }
  std::chrono::seconds Duration() const {
    return std::chrono::duration_cast<std::chrono::seconds>(ends - starts);
  }
};

/**
 * @brief Partition key function
 */
using PartitionFunc = std::function<std::string(const Record &)>;

inline std::string ByUPI(const Record &r) { return r.Key(); }
inline std::string BySource(const Record &r) { return r.source; }

enum class GroupBy { UPI, Source };

inline PartitionFunc MakePartitionFunc(GroupBy group) {
  if (group == GroupBy::Source) {
    return BySource;
  }
  return ByUPI;
}

}  // namespace UPIFINDER

#endif  // UPIFINDER_CORE_RECORD_HPP
