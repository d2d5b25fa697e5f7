/**
 * @file TableWriter.hpp
 * @brief Aligned text columns
 */

#ifndef UPIFINDER_REPORT_TABLE_WRITER_HPP
#define UPIFINDER_REPORT_TABLE_WRITER_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace UPIFINDER {
namespace Report {

/**
 * @brief Buffers rows and pads every column but the last
 *
 * A column is as wide as its longest cell plus the padding, and never
 * narrower than the minimum width.
 *
 * Usage:
 *   TableWriter table;
 *   table.AddRow({"UPI", "Files"});
 *   table.AddRow({"38/XYZ", "12"});
 *   table.Write(std::cout);
 */
class TableWriter {
public:
  explicit TableWriter(size_t minWidth = 16, size_t padding = 4);

  void AddRow(std::vector<std::string> cells);
  void Write(std::ostream &out) const;

  size_t GetRowCount() const { return fRows.size(); }

private:
  size_t fMinWidth;
  size_t fPadding;
  std::vector<std::vector<std::string>> fRows;
};

}  // namespace Report
}  // namespace UPIFINDER

#endif  // UPIFINDER_REPORT_TABLE_WRITER_HPP
