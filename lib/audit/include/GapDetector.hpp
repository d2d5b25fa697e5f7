/**
 * @file GapDetector.hpp
 * @brief Finds holes in the sequence counters of a record stream
 *
 * Records arrive unordered. A record that falls into a hole reported
 * earlier narrows or closes it ("refill") unless every gap is kept.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ArchiveScanner.hpp"
#include "upifinder/core/RangeSet.hpp"
#include "upifinder/core/Record.hpp"

namespace UPIFINDER {
namespace Audit {

struct GapOptions {
    bool keep_invalid = false;            ///< Count ".bad" records as present
    bool all_gaps = false;                ///< Report every gap, never refill
    std::chrono::seconds min_duration{0}; ///< Drop shorter gaps (0 keeps all)
    PartitionFunc partition = ByUPI;
};

/**
 * @brief Gap state machine, one state per partition
 *
 * Per partition it keeps the latest record by acquisition time, the open
 * gaps sorted by their "after" bound, and the sequence numbers already
 * integrated. A repeated sequence number only refreshes the latest record.
 * A new gap spans [before, after] by sequence and [starts, ends] by time,
 * ordered so that starts <= ends even when the later sequence was acquired
 * first.
 *
 * Refill of the first open gap whose after >= sequence:
 *   sequence == before + 1        shrink from below, drop when empty
 *   before < sequence < after and acquired inside [starts, ends]
 *                                 split into [before, seq] and [seq, after]
 *   before < sequence < after otherwise
 *                                 shrink from below
 *
 * Usage:
 *   GapDetector detector(options);
 *   detector.Consume(*queue);
 *   for (const Gap &gap : detector.GetGaps()) { ... }
 */
class GapDetector {
public:
    explicit GapDetector(GapOptions options = GapOptions{});

    void Update(const Record &record);

    /**
     * @brief Drain the queue until it is closed
     * @return Number of records consumed
     */
    uint64_t Consume(Archive::RecordQueue &queue);

    /**
     * @brief Open gaps of every partition, by partition key then sequence
     */
    std::vector<Gap> GetGaps() const;

    /**
     * @brief Sum of the missing counts of the open gaps
     */
    uint64_t GetMissingCount() const;

    /**
     * @brief Sum of the durations of the open gaps
     */
    std::chrono::seconds GetElapsed() const;

    size_t GetPartitionCount() const { return partitions_.size(); }
    const GapOptions &GetOptions() const { return options_; }

    void Reset();

private:
    struct Partition {
        std::optional<Record> last;
        std::vector<Gap> gaps;
        RangeSet seen;
    };

    bool Refill(Partition &partition, const Record &record);
    void Append(Partition &partition, Gap gap);
    static void Remember(Partition &partition, const Record &record);

    GapOptions options_;
    std::map<std::string, Partition> partitions_;
};

}  // namespace Audit
}  // namespace UPIFINDER
