#include "upifinder/core/RangeSet.hpp"

#include <algorithm>
#include <iterator>

namespace UPIFINDER {

std::string Range::ToString() const {
  return "[" + std::to_string(first) + ", " + std::to_string(last) + "]";
}

bool RangeSet::Insert(uint32_t v) {
  // First range whose upper bound is >= v
  auto it = std::lower_bound(
      fRanges.begin(), fRanges.end(), v,
      [](const Range &r, uint32_t value) { return r.last < value; });

  if (it == fRanges.end()) {
    if (!fRanges.empty() && fRanges.back().last + 1 == v) {
      fRanges.back().last = v;
    } else {
      fRanges.push_back(Range{v, v});
    }
    return false;
  }

  if (it->Has(v)) {
    return true;
  }

  // v < it->first from here on
  const bool joins_prev = it != fRanges.begin() && std::prev(it)->last + 1 == v;
  const bool joins_next = it->first - 1 == v;

  if (joins_prev && joins_next) {
    std::prev(it)->last = it->last;
    fRanges.erase(it);
  } else if (joins_next) {
    it->first = v;
  } else if (joins_prev) {
    std::prev(it)->last = v;
  } else {
    fRanges.insert(it, Range{v, v});
  }
  return false;
}

bool RangeSet::Has(uint32_t v) const {
  auto it = std::lower_bound(
      fRanges.begin(), fRanges.end(), v,
      [](const Range &r, uint32_t value) { return r.last < value; });
  return it != fRanges.end() && it->Has(v);
}

uint64_t RangeSet::Total() const {
  if (fRanges.empty()) {
    return 0;
  }
  return static_cast<uint64_t>(fRanges.back().last) - fRanges.front().first + 1;
}

uint64_t RangeSet::Missing() const {
  uint64_t missing = 0;
  for (size_t i = 1; i < fRanges.size(); ++i) {
    missing += static_cast<uint64_t>(fRanges[i].first) - fRanges[i - 1].last - 1;
  }
  return missing;
}

std::vector<Range> RangeSet::MissingRanges() const {
  std::vector<Range> holes;
  if (fRanges.size() > 1) {
    holes.reserve(fRanges.size() - 1);
  }
  for (size_t i = 1; i < fRanges.size(); ++i) {
    holes.push_back(Range{fRanges[i - 1].last, fRanges[i].first});
  }
  return holes;
}

std::pair<uint32_t, uint32_t> RangeSet::GetRange() const {
  if (fRanges.empty()) {
    return {0, 0};
  }
  return {fRanges.front().first, fRanges.back().last};
}

}  // namespace UPIFINDER
