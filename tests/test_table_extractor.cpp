#include <catch2/catch_all.hpp>

#include "table_extractor.hpp"
#include "table_writer.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

size_t widestRow(const TableData& table) {
  size_t widest = 0;
  for (const auto& row : table.rows) widest = std::max(widest, row.cells.size());
  return widest;
}

TableExtractionConfig rawConfig() {
  return TableExtractionConfig()
      .withHeaders(false)
      .withEmptyCells(true)
      .withMergeCellsHandling(MergeCellsHandling::Ignore);
}

RawGrid staffGrid() {
  const CellFormatting bold = CellFormatting::boldText();
  return {
    {RawCell("Name", bold), RawCell("Age", bold), RawCell("Department", bold)},
    {"John Smith", "25", "Engineering"},
    {"Jane Doe", "30", ""},
    {"Jim Beam", "41", "Sales"},
  };
}

} // namespace

TEST_CASE("cells are trimmed and typed", "[extractor]") {
  TableData table = extractTable({{"  a ", "", "   "}, {"b"}}, rawConfig());

  REQUIRE(table.rowCount == 2);
  REQUIRE(table.columnCount == 3);
  REQUIRE(table.rows[0].cells[0].content == "a");
  REQUIRE(table.rows[0].cells[0].cellType == CellType::Data);
  REQUIRE(table.rows[0].cells[1].cellType == CellType::Empty);
  REQUIRE(table.rows[0].cells[2].cellType == CellType::Empty);
  REQUIRE(table.rows[1].rowIndex == 1);
}

TEST_CASE("column count always matches the widest row", "[extractor]") {
  const RawGrid grid = {{"a", "", "c", ""}, {"d"}, {"", "", "f"}};

  TableData kept = extractTable(grid, rawConfig());
  REQUIRE(kept.columnCount == 4);
  REQUIRE(kept.columnCount == widestRow(kept));

  TableData filtered = extractTable(grid, rawConfig().withEmptyCells(false));
  REQUIRE(filtered.columnCount == 2);
  REQUIRE(filtered.columnCount == widestRow(filtered));
  REQUIRE(filtered.rows[2].cells.size() == 1);
  REQUIRE(filtered.rows[2].cells[0].content == "f");

  TableData merged = extractTable(grid, TableExtractionConfig().withEmptyCells(true));
  REQUIRE(merged.columnCount == widestRow(merged));
}

TEST_CASE("formatting is kept only when asked for", "[extractor]") {
  const RawGrid grid = {{RawCell("Name", CellFormatting::boldText()), "plain"}};

  TableData plain = extractTable(grid, rawConfig());
  REQUIRE_FALSE(plain.rows[0].cells[0].formatting.has_value());
  REQUIRE(plain.rows[0].cells[0].formattedContent == "Name");

  TableData styled = extractTable(grid, rawConfig().withFormatting(true));
  REQUIRE(styled.rows[0].cells[0].formatting.has_value());
  REQUIRE(styled.rows[0].cells[0].formatting->bold);
  REQUIRE(styled.rows[0].cells[0].formattedContent == "**Name**");
  REQUIRE_FALSE(styled.rows[0].cells[1].formatting.has_value());
  REQUIRE(styled.rows[0].cells[1].formattedContent == "plain");
}

TEST_CASE("full pipeline detects headers and merges", "[extractor]") {
  auto config = TableExtractionConfig().withFormatting(true).withEmptyCells(true);
  TableData table = extractTable(staffGrid(), config);

  REQUIRE(table.hasHeader);
  REQUIRE(*table.headers == std::vector<std::string>{"Name", "Age", "Department"});
  REQUIRE(table.rows[0].isHeader);
  REQUIRE(table.rows[0].cells[0].cellType == CellType::Header);

  REQUIRE(table.rows[2].cells[1].colspan == std::optional<size_t>(2));
  REQUIRE(table.rows[2].cells[2].isMerged());
  REQUIRE(table.columnCount == 3);
}

TEST_CASE("processing a processed table changes nothing", "[extractor]") {
  SECTION("empty cells kept") {
    auto config = TableExtractionConfig().withFormatting(true).withEmptyCells(true);
    TableData table = extractTable(staffGrid(), config);
    const std::string before = renderJson(table, true);

    processTable(table, config);
    REQUIRE(renderJson(table, true) == before);
  }

  SECTION("empty cells filtered") {
    auto config = TableExtractionConfig().withFormatting(true);
    TableData table = extractTable(staffGrid(), config);
    REQUIRE(table.rows[2].cells.size() == 2);
    const std::string before = renderJson(table, true);

    processTable(table, config);
    REQUIRE(renderJson(table, true) == before);
  }

  SECTION("expanded merges") {
    auto config = TableExtractionConfig()
                      .withFormatting(true)
                      .withMergeCellsHandling(MergeCellsHandling::Expand);
    TableData table = extractTable(staffGrid(), config);
    REQUIRE(table.rows[2].cells.size() == 3);
    REQUIRE(table.rows[2].cells[2].content == "30");
    const std::string before = renderJson(table, true);

    processTable(table, config);
    REQUIRE(renderJson(table, true) == before);
  }
}

TEST_CASE("filterEmptyCells is idempotent", "[extractor]") {
  TableData table = extractTable({{"a", "", "b"}, {"", ""}}, rawConfig());
  filterEmptyCells(table);
  REQUIRE(table.columnCount == 2);
  REQUIRE(table.rows[1].cells.empty());
  REQUIRE(table.rowCount == 2);

  filterEmptyCells(table);
  REQUIRE(table.columnCount == 2);
  REQUIRE(table.rows[0].cells[1].content == "b");
}

TEST_CASE("extraction is deterministic", "[extractor]") {
  auto config = TableExtractionConfig::full();
  TableData a = extractTable(staffGrid(), config);
  TableData b = extractTable(staffGrid(), config);
  REQUIRE(renderJson(a, true) == renderJson(b, true));
}

TEST_CASE("empty grids give empty tables", "[extractor]") {
  TableData table = extractTable({}, TableExtractionConfig());
  REQUIRE(table.isEmpty());
  REQUIRE(table.rowCount == 0);
  REQUIRE(table.columnCount == 0);
  REQUIRE_FALSE(table.hasHeader);
}

TEST_CASE("extractTables keeps document order", "[extractor]") {
  std::vector<RawGrid> grids = {{{"first"}}, {{"second"}, {"row"}}};
  auto tables = extractTables(grids, TableExtractionConfig::simple());
  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].rows[0].cells[0].content == "first");
  REQUIRE(tables[1].rowCount == 2);
}

TEST_CASE("a second pass does not find a header the first pass rejected", "[extractor]") {
  const std::vector<RawGrid> grids = {
    {{"x", "Name"}, {""}, {"2023-01-02", "1"}, {"Name", "Name", "12", "1"}},
    {{"a", ""}, {"", "Total"}, {"Count", "", "3"}},
    {{"1", "", "b"}, {"", "Name"}, {"Date", "Type", ""}},
  };
  const std::vector<TableExtractionConfig> configs = {
    TableExtractionConfig(),
    TableExtractionConfig().withMergeCellsHandling(MergeCellsHandling::Expand).withEmptyCells(true),
    TableExtractionConfig().withMergeCellsHandling(MergeCellsHandling::Expand),
  };

  for (const auto& grid : grids) {
    for (const auto& config : configs) {
      TableData table = extractTable(grid, config);
      const bool hadHeader = table.hasHeader;
      const std::string before = renderJson(table);

      processTable(table, config);
      REQUIRE(table.hasHeader == hadHeader);
      REQUIRE(renderJson(table) == before);
    }
  }

  TableData table = extractTable(grids[0], TableExtractionConfig());
  REQUIRE_FALSE(table.hasHeader);
  REQUIRE(table.headerEvaluated);
}
