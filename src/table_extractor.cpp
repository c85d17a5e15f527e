#include "table_extractor.hpp"

#include "header_detector.hpp"
#include "merge_detector.hpp"

#include <algorithm>
#include <new>

namespace {

TableCell buildCell(const RawCell& raw, const TableExtractionConfig& config) {
  std::string content = trimText(raw.text);
  TableCell cell = content.empty() ? TableCell::empty() : TableCell(std::move(content));

  if (config.preserveFormatting && raw.formatting && raw.formatting->hasFormatting()) {
    cell.formatting = raw.formatting;
    cell.formattedContent = raw.formatting->applyToText(cell.content);
  }
  return cell;
}

} // namespace

TableData extractTable(const RawGrid& grid, const TableExtractionConfig& config) {
  try {
    TableData table(grid.size());
    for (size_t r = 0; r < grid.size(); ++r) {
      TableRow row(r, grid[r].size());
      for (const auto& raw : grid[r]) row.addCell(buildCell(raw, config));
      table.addRow(std::move(row));
    }
    processTable(table, config);
    return table;
  } catch (const std::bad_alloc&) {
    throw TableExtractionError("out of memory while extracting a table with " +
                               std::to_string(grid.size()) + " rows");
  }
}

std::vector<TableData> extractTables(const std::vector<RawGrid>& grids,
                                     const TableExtractionConfig& config) {
  std::vector<TableData> tables;
  tables.reserve(grids.size());
  for (const auto& grid : grids) tables.push_back(extractTable(grid, config));
  return tables;
}

void processTable(TableData& table, const TableExtractionConfig& config) {
  table.updateStatistics();

  if (config.detectHeaders) {
    detectHeader(table);
  }

  handleMerges(table, config.mergeCellsHandling);

  if (!config.includeEmptyCells) {
    filterEmptyCells(table);
  }
}

void filterEmptyCells(TableData& table) {
  for (auto& row : table.rows) {
    row.cells.erase(std::remove_if(row.cells.begin(), row.cells.end(),
                                   [](const TableCell& c) { return c.isEmpty(); }),
                    row.cells.end());
  }
  table.updateStatistics();
}
