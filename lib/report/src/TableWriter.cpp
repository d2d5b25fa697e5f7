#include "TableWriter.hpp"

#include <algorithm>
#include <iomanip>

namespace UPIFINDER {
namespace Report {

TableWriter::TableWriter(size_t minWidth, size_t padding)
    : fMinWidth(minWidth), fPadding(padding) {}

void TableWriter::AddRow(std::vector<std::string> cells) {
  fRows.push_back(std::move(cells));
}

void TableWriter::Write(std::ostream &out) const {
  std::vector<size_t> widths;
  for (const auto &row : fRows) {
    if (row.size() > widths.size()) {
      widths.resize(row.size(), 0);
    }
    for (size_t i = 0; i < row.size(); ++i) {
      widths[i] = std::max(widths[i], row[i].size() + fPadding);
    }
  }
  for (auto &width : widths) {
    width = std::max(width, fMinWidth);
  }

  const std::ios_base::fmtflags flags = out.flags();
  for (const auto &row : fRows) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i + 1 == row.size()) {
        out << row[i];
      } else {
        out << std::left << std::setw(static_cast<int>(widths[i])) << row[i];
      }
    }
    out << '\n';
  }
  out.flags(flags);
}

}  // namespace Report
}  // namespace UPIFINDER
