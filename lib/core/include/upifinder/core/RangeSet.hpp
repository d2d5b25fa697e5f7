#ifndef UPIFINDER_CORE_RANGE_SET_HPP
#define UPIFINDER_CORE_RANGE_SET_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace UPIFINDER {

/**
 * @brief Closed interval [first, last] of sequence numbers, first <= last
 */
struct Range {
  uint32_t first = 0;
  uint32_t last = 0;

  bool Has(uint32_t v) const { return first <= v && v <= last; }
  std::string ToString() const;

  bool operator==(const Range &other) const {
    return first == other.first && last == other.last;
  }
  bool operator!=(const Range &other) const { return !(*this == other); }
};

/**
 * @brief Sequence numbers observed so far for one partition
 *
 * Stored as a sorted vector of disjoint, non-adjacent ranges: for every
 * consecutive pair, next.first > prev.last + 1. Values may be inserted in
 * any order; the final ranges only depend on the set of values.
 *
 * Usage:
 *   RangeSet seen;
 *   for each record:
 *       if (seen.Insert(record.sequence)) {
 *           // duplicate
 *       }
 *   seen.Missing();  // number of holes
 */
class RangeSet {
public:
  /**
   * @brief Add a value
   * @return true if the value was already present (nothing changed)
   */
  bool Insert(uint32_t v);

  bool Has(uint32_t v) const;

  /**
   * @brief Full span last - first + 1 including holes, 0 when empty
   */
  uint64_t Total() const;

  /**
   * @brief Number of values inside the span that were never inserted
   */
  uint64_t Missing() const;

  /**
   * @brief Holes between consecutive ranges as [prev.last, next.first]
   *
   * Both bounds are present values; the interior is missing.
   */
  std::vector<Range> MissingRanges() const;

  /**
   * @brief (first of first range, last of last range), (0, 0) when empty
   */
  std::pair<uint32_t, uint32_t> GetRange() const;

  const std::vector<Range> &Ranges() const { return fRanges; }
  bool Empty() const { return fRanges.empty(); }
  size_t Size() const { return fRanges.size(); }
  void Clear() { fRanges.clear(); }

private:
  std::vector<Range> fRanges;
};

}  // namespace UPIFINDER

#endif  // UPIFINDER_CORE_RANGE_SET_HPP
