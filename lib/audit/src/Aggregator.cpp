/**
 * @file Aggregator.cpp
 * @brief Implementation of Coze and Aggregator
 */

#include "Aggregator.hpp"

namespace UPIFINDER {
namespace Audit {

void Coze::Update(const Record &record)
{
    const bool empty = count == 0;

    count++;
    size += record.size;

    if (empty || record.acq_time <= starts) {
        starts = record.acq_time;
        first = record.sequence;
    }
    if (empty || record.acq_time >= ends) {
        ends = record.acq_time;
        last = record.sequence;
    }

    if (!record.IsValid()) {
        invalid++;
        return;
    }
    if (!ranges.Insert(record.sequence)) {
        uniq++;
    }
}

double Coze::Corrupted() const
{
    if (count == 0 || invalid == 0) {
        return 0;
    }
    return static_cast<double>(invalid) / static_cast<double>(count);
}

Aggregator::Aggregator(PartitionFunc partition)
    : partition_(partition ? std::move(partition) : PartitionFunc(ByUPI))
{
}

void Aggregator::Update(const Record &record)
{
    std::string key = partition_(record);
    auto it = results_.find(key);
    if (it == results_.end()) {
        it = results_.emplace(key, Coze{}).first;
        it->second.upi = key;
    }
    it->second.Update(record);
}

uint64_t Aggregator::Consume(Archive::RecordQueue &queue)
{
    uint64_t consumed = 0;
    while (auto record = queue.Pop()) {
        Update(*record);
        consumed++;
    }
    return consumed;
}

Coze Aggregator::Total() const
{
    Coze total;
    for (const auto &entry : results_) {
        const Coze &c = entry.second;
        total.count += c.count;
        total.uniq += c.uniq;
        total.invalid += c.invalid;
        total.size += c.size;
    }
    return total;
}

void Aggregator::Reset()
{
    results_.clear();
}

}  // namespace Audit
}  // namespace UPIFINDER
