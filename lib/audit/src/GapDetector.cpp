/**
 * @file GapDetector.cpp
 * @brief Implementation of GapDetector
 */

#include "GapDetector.hpp"

#include <algorithm>
#include <utility>

namespace UPIFINDER {
namespace Audit {

GapDetector::GapDetector(GapOptions options) : options_(std::move(options))
{
    if (!options_.partition) {
        options_.partition = ByUPI;
    }
}

void GapDetector::Update(const Record &record)
{
    if (!options_.keep_invalid && !record.IsValid()) {
        return;
    }

    const std::string key = options_.partition(record);
    Partition &partition = partitions_[key];

    // Already integrated: duplicate or repeat
    if (partition.seen.Insert(record.sequence)) {
        Remember(partition, record);
        return;
    }

    if (!options_.all_gaps && Refill(partition, record)) {
        Remember(partition, record);
        return;
    }

    if (partition.last && record.sequence > partition.last->sequence) {
        Gap gap;
        gap.upi = key;
        gap.before = partition.last->sequence;
        gap.after = record.sequence;
        gap.starts = partition.last->acq_time;
        gap.ends = record.acq_time;
        if (gap.ends < gap.starts) {
            std::swap(gap.starts, gap.ends);
        }

        bool long_enough = options_.min_duration.count() == 0 ||
                           gap.Duration() >= options_.min_duration;
        if (gap.after - gap.before > 1 && long_enough) {
            Append(partition, std::move(gap));
        }
    }
    Remember(partition, record);
}

bool GapDetector::Refill(Partition &partition, const Record &record)
{
    auto &gaps = partition.gaps;
    const uint32_t sequence = record.sequence;

    auto it = std::lower_bound(
        gaps.begin(), gaps.end(), sequence,
        [](const Gap &gap, uint32_t value) { return gap.after < value; });
    if (it == gaps.end() || sequence <= it->before || sequence >= it->after) {
        return false;
    }

    const bool inside_window =
        record.acq_time >= it->starts && record.acq_time <= it->ends;

    if (sequence == it->before + 1 || !inside_window) {
        it->before = sequence;
        it->starts = record.acq_time;
        if (it->Count() == 0) {
            gaps.erase(it);
        }
        return true;
    }

    // Split: the lower piece keeps at least one missing value
    Gap upper = *it;
    upper.before = sequence;
    upper.starts = record.acq_time;

    it->after = sequence;
    it->ends = record.acq_time;

    if (upper.Count() > 0) {
        gaps.insert(it + 1, std::move(upper));
    }
    return true;
}

void GapDetector::Append(Partition &partition, Gap gap)
{
    auto &gaps = partition.gaps;
    auto it = std::upper_bound(
        gaps.begin(), gaps.end(), gap.after,
        [](uint32_t value, const Gap &other) { return value < other.after; });
    gaps.insert(it, std::move(gap));
}

void GapDetector::Remember(Partition &partition, const Record &record)
{
    if (!partition.last || record.acq_time >= partition.last->acq_time) {
        partition.last = record;
    }
}

uint64_t GapDetector::Consume(Archive::RecordQueue &queue)
{
    uint64_t consumed = 0;
    while (auto record = queue.Pop()) {
        Update(*record);
        consumed++;
    }
    return consumed;
}

std::vector<Gap> GapDetector::GetGaps() const
{
    std::vector<Gap> gaps;
    for (const auto &entry : partitions_) {
        const auto &open = entry.second.gaps;
        gaps.insert(gaps.end(), open.begin(), open.end());
    }
    return gaps;
}

uint64_t GapDetector::GetMissingCount() const
{
    uint64_t missing = 0;
    for (const auto &entry : partitions_) {
        for (const Gap &gap : entry.second.gaps) {
            missing += gap.Count();
        }
    }
    return missing;
}

std::chrono::seconds GapDetector::GetElapsed() const
{
    std::chrono::seconds elapsed{0};
    for (const auto &entry : partitions_) {
        for (const Gap &gap : entry.second.gaps) {
            elapsed += gap.Duration();
        }
    }
    return elapsed;
}

void GapDetector::Reset()
{
    partitions_.clear();
}

}  // namespace Audit
}  // namespace UPIFINDER
