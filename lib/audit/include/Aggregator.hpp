/**
 * @file Aggregator.hpp
 * @brief Per-partition counters for the walk and inspect reports
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include "ArchiveScanner.hpp"
#include "upifinder/core/RangeSet.hpp"
#include "upifinder/core/Record.hpp"

namespace UPIFINDER {
namespace Audit {

/**
 * @brief Running statistics of one partition
 */
struct Coze {
    std::string upi;       ///< Partition key
    uint64_t count = 0;    ///< Records seen
    uint64_t uniq = 0;     ///< Distinct valid sequence numbers
    uint64_t invalid = 0;  ///< Records named ".bad"
    uint64_t size = 0;     ///< Sum of declared sizes

    TimePoint starts;  ///< Earliest acquisition time
    TimePoint ends;    ///< Latest acquisition time
    uint32_t first = 0;  ///< Sequence of the earliest record
    uint32_t last = 0;   ///< Sequence of the latest record

    RangeSet ranges;  ///< Valid sequence numbers seen

    /**
     * @brief Fold one record in
     *
     * The time bounds move on ties too, so the later of two records with
     * the same acquisition time provides first/last.
     */
    void Update(const Record &record);

    /**
     * @brief invalid / count, 0 when either is 0
     */
    double Corrupted() const;

    uint64_t Missing() const { return ranges.Missing(); }
    std::pair<uint32_t, uint32_t> Range() const { return ranges.GetRange(); }
};

/**
 * @brief Builds one Coze per partition from a record stream
 *
 * Owned by the single consumer of the scanner queue; not thread safe.
 *
 * Usage:
 *   Aggregator aggregator(ByUPI);
 *   aggregator.Consume(*queue);
 *   for (const auto &[key, coze] : aggregator.GetResults()) { ... }
 */
class Aggregator {
public:
    explicit Aggregator(PartitionFunc partition = ByUPI);

    void Update(const Record &record);

    /**
     * @brief Drain the queue until it is closed
     * @return Number of records consumed
     */
    uint64_t Consume(Archive::RecordQueue &queue);

    /**
     * @brief Results keyed and ordered by partition key
     */
    const std::map<std::string, Coze> &GetResults() const { return results_; }

    /**
     * @brief Sum of count, uniq, invalid and size over all partitions
     */
    Coze Total() const;

    void Reset();

private:
    PartitionFunc partition_;
    std::map<std::string, Coze> results_;
};

}  // namespace Audit
}  // namespace UPIFINDER
