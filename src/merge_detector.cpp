#include "merge_detector.hpp"

#include <utility>
#include <vector>

namespace {

enum class MergeOrientation { Horizontal, Vertical };

// Anchor is (startRow, startCol).
struct MergedRange {
  size_t startRow;
  size_t endRow;
  size_t startCol;
  size_t endCol;
  MergeOrientation orientation;
};

using ClaimGrid = std::vector<std::vector<bool>>;

// Cells marked by an earlier pass are claimed up front so they are never re-marked.
ClaimGrid makeClaimGrid(const TableData& table) {
  ClaimGrid claimed;
  claimed.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    std::vector<bool> flags(row.cells.size(), false);
    for (size_t c = 0; c < row.cells.size(); ++c) flags[c] = row.cells[c].isMerged();
    claimed.push_back(std::move(flags));
  }
  return claimed;
}

void claim(ClaimGrid& claimed, const MergedRange& range) {
  for (size_t r = range.startRow; r <= range.endRow; ++r) {
    for (size_t c = range.startCol; c <= range.endCol; ++c) claimed[r][c] = true;
  }
}

void detectHorizontal(const TableData& table, ClaimGrid& claimed, std::vector<MergedRange>& out) {
  for (size_t r = 0; r < table.rows.size(); ++r) {
    const auto& cells = table.rows[r].cells;
    const auto& taken = claimed[r];
    auto freeEmpty = [&](size_t col) { return !taken[col] && cells[col].isEmpty(); };
    size_t c = 0;
    while (c < cells.size()) {
      if (taken[c] || cells[c].isEmpty() || c + 1 >= cells.size() || !freeEmpty(c + 1)) {
        c++;
        continue;
      }
      size_t end = c + 1;
      while (end + 1 < cells.size() && freeEmpty(end + 1)) end++;
      MergedRange range{r, r, c, end, MergeOrientation::Horizontal};
      claim(claimed, range);
      out.push_back(range);
      c = end + 1;
    }
  }
}

bool hasCell(const TableData& table, size_t row, size_t col) {
  return col < table.rows[row].cells.size();
}

void detectVertical(const TableData& table, ClaimGrid& claimed, std::vector<MergedRange>& out) {
  const size_t rowCount = table.rows.size();
  for (size_t c = 0; c < table.columnCount; ++c) {
    size_t r = 0;
    while (r < rowCount) {
      bool anchors = hasCell(table, r, c) && !claimed[r][c] && !table.rows[r].cells[c].isEmpty();
      if (!anchors) {
        r++;
        continue;
      }
      size_t end = r;
      while (end + 1 < rowCount && hasCell(table, end + 1, c) && !claimed[end + 1][c] &&
             table.rows[end + 1].cells[c].isEmpty()) {
        end++;
      }
      if (end > r) {
        MergedRange range{r, end, c, c, MergeOrientation::Vertical};
        claim(claimed, range);
        out.push_back(range);
      }
      r = end + 1;
    }
  }
}

std::vector<MergedRange> detectMergedRanges(TableData& table) {
  table.updateStatistics();
  ClaimGrid claimed = makeClaimGrid(table);
  std::vector<MergedRange> ranges;
  detectHorizontal(table, claimed, ranges);
  detectVertical(table, claimed, ranges);
  return ranges;
}

void markRange(TableData& table, const MergedRange& range) {
  const size_t length = range.orientation == MergeOrientation::Horizontal
                          ? range.endCol - range.startCol + 1
                          : range.endRow - range.startRow + 1;
  for (size_t r = range.startRow; r <= range.endRow; ++r) {
    for (size_t c = range.startCol; c <= range.endCol; ++c) {
      TableCell& cell = table.rows[r].cells[c];
      if (r == range.startRow && c == range.startCol) {
        if (range.orientation == MergeOrientation::Horizontal) {
          cell.setMerged(length, std::nullopt);
        } else {
          cell.setMerged(std::nullopt, length);
        }
      } else {
        cell.setMerged(std::nullopt, std::nullopt);
      }
    }
  }
}

void expandRange(TableData& table, const MergedRange& range) {
  const TableCell& anchor = table.rows[range.startRow].cells[range.startCol];
  const std::string content = anchor.content;
  const std::string formatted = anchor.formattedContent;
  for (size_t r = range.startRow; r <= range.endRow; ++r) {
    for (size_t c = range.startCol; c <= range.endCol; ++c) {
      if (r == range.startRow && c == range.startCol) continue;
      TableCell& cell = table.rows[r].cells[c];
      cell.content = content;
      cell.formattedContent = formatted;
    }
  }
}

} // namespace

void handleMerges(TableData& table, MergeCellsHandling policy) {
  if (policy == MergeCellsHandling::Ignore) return;

  const std::vector<MergedRange> ranges = detectMergedRanges(table);
  for (const auto& range : ranges) markRange(table, range);

  if (policy == MergeCellsHandling::Expand) {
    for (const auto& range : ranges) expandRange(table, range);
  }
}
