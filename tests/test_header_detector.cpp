#include <catch2/catch_all.hpp>

#include "header_detector.hpp"

#include <string>
#include <vector>

namespace {

TableRow makeRow(size_t index, const std::vector<std::string>& texts) {
  TableRow row(index);
  for (const auto& t : texts) row.addCell(t.empty() ? TableCell::empty() : TableCell(t));
  return row;
}

TableData makeTable(const std::vector<std::vector<std::string>>& grid) {
  TableData table;
  for (size_t r = 0; r < grid.size(); ++r) table.addRow(makeRow(r, grid[r]));
  return table;
}

} // namespace

TEST_CASE("labelled first row becomes the header", "[header]") {
  TableData table = makeTable({
    {"Name", "Age", "Department"},
    {"John", "25", "Eng"},
    {"Jane", "30", "Mkt"},
  });

  REQUIRE(headerConfidence(table) > kHeaderConfidenceThreshold);
  detectHeader(table);

  REQUIRE(table.hasHeader);
  REQUIRE(table.headers.has_value());
  REQUIRE(*table.headers == std::vector<std::string>{"Name", "Age", "Department"});
  REQUIRE(table.rows[0].isHeader);
  for (const auto& cell : table.rows[0].cells) REQUIRE(cell.cellType == CellType::Header);
  REQUIRE_FALSE(table.rows[1].isHeader);
  REQUIRE(table.rows[1].cells[0].cellType == CellType::Data);
}

TEST_CASE("longer data values strengthen the header signal", "[header]") {
  TableData table = makeTable({
    {"Name", "Age", "Department"},
    {"John Smith", "25", "Engineering"},
    {"Jane Doe", "30", "Marketing"},
  });

  auto scores = scoreHeaderSignals(table);
  REQUIRE(scores.size() == 5);
  REQUIRE(scores[3].name == "length");
  REQUIRE(scores[3].score == Catch::Approx(0.8));
  REQUIRE(headerConfidence(scores) == Catch::Approx(0.67));

  detectHeader(table);
  REQUIRE(table.hasHeader);
}

TEST_CASE("numeric first row is not a header", "[header]") {
  TableData table = makeTable({
    {"1250.50", "3400.75", "980.25"},
    {"1100.00", "2900.10", "875.40"},
  });

  REQUIRE(headerConfidence(table) == Catch::Approx(0.36));
  detectHeader(table);

  REQUIRE_FALSE(table.hasHeader);
  REQUIRE_FALSE(table.headers.has_value());
  REQUIRE_FALSE(table.rows[0].isHeader);
}

TEST_CASE("header detection needs rows", "[header]") {
  TableData empty;
  REQUIRE(scoreHeaderSignals(empty).empty());
  REQUIRE(headerConfidence(empty) == 0.0);
  detectHeader(empty);
  REQUIRE_FALSE(empty.hasHeader);

  TableData single = makeTable({{"Name", "Age"}});
  detectHeader(single);
  REQUIRE_FALSE(single.hasHeader);
}

TEST_CASE("detectHeader leaves an existing header alone", "[header]") {
  TableData table = makeTable({
    {"Name", "Age", "Department"},
    {"John", "25", "Eng"},
    {"Jane", "30", "Mkt"},
  });
  detectHeader(table);
  REQUIRE(table.hasHeader);

  const auto headers = table.headers;
  detectHeader(table);
  REQUIRE(table.headers == headers);
  REQUIRE(table.rows[0].isHeader);
  REQUIRE_FALSE(table.rows[1].isHeader);
}

TEST_CASE("signal weights add up to one", "[header]") {
  TableData table = makeTable({{"a", "b"}, {"c", "d"}});
  double sum = 0.0;
  std::vector<std::string> names;
  for (const auto& s : scoreHeaderSignals(table)) {
    sum += s.weight;
    names.push_back(s.name);
  }
  REQUIRE(sum == Catch::Approx(1.0));
  REQUIRE(names == std::vector<std::string>{"formatting", "content", "consistency", "length", "uniqueness"});
}

TEST_CASE("formatting signal compares header styling with data styling", "[header][signal]") {
  TableRow first(0);
  first.addCell(TableCell("Region", CellFormatting::boldText()));
  first.addCell(TableCell("Total", CellFormatting::boldText()));

  std::vector<TableRow> plain = {makeRow(1, {"North", "10"}), makeRow(2, {"South", "20"})};
  REQUIRE(formattingDifferenceScore(first, plain) == Catch::Approx(1.0));

  TableRow italicRow(1);
  italicRow.addCell(TableCell("North", CellFormatting::italicText()));
  italicRow.addCell(TableCell("10", CellFormatting::italicText()));
  REQUIRE(formattingDifferenceScore(first, {italicRow}) == Catch::Approx(1.0));

  TableRow boldRow(1);
  boldRow.addCell(TableCell("North", CellFormatting::boldText()));
  boldRow.addCell(TableCell("10", CellFormatting::boldText()));
  REQUIRE(formattingDifferenceScore(first, {boldRow}) == 0.0);

  REQUIRE(formattingDifferenceScore(makeRow(0, {"a", "b"}), plain) == 0.0);
  REQUIRE(formattingDifferenceScore(first, {}) == 0.0);
}

TEST_CASE("content signal looks for header-like labels", "[header][signal]") {
  REQUIRE(headerContentScore(makeRow(0, {"Name", "Status"})) == Catch::Approx(1.0));
  REQUIRE(headerContentScore(makeRow(0, {"1000", "2000"})) == 0.0);
  // "ab" is too short and lowercase, "x1" likewise.
  REQUIRE(headerContentScore(makeRow(0, {"ab", "x1"})) == 0.0);
  REQUIRE(headerContentScore(TableRow(0)) == 0.0);
}

TEST_CASE("consistency signal uses the majority type per column", "[header][signal]") {
  std::vector<TableRow> rows = {
    makeRow(1, {"1.5", "alpha"}),
    makeRow(2, {"2.5", "beta"}),
    makeRow(3, {"abc", "gamma"}),
  };
  // Column 0 is 2/3 numbers, column 1 all text.
  REQUIRE(dataTypeConsistencyScore(rows) == Catch::Approx((2.0 / 3.0 + 1.0) / 2.0));
  REQUIRE(dataTypeConsistencyScore({}) == 0.0);
}

TEST_CASE("length signal prefers short labels over long values", "[header][signal]") {
  TableRow first = makeRow(0, {"ID"});
  REQUIRE(textLengthScore(first, {makeRow(1, {"a long description here"})}) == Catch::Approx(0.8));
  REQUIRE(textLengthScore(first, {makeRow(1, {"AB"})}) == Catch::Approx(0.4));
  REQUIRE(textLengthScore(first, {}) == 0.0);
  REQUIRE(textLengthScore(makeRow(0, {std::string(40, 'x')}), {makeRow(1, {"y"})}) == 0.0);
}

TEST_CASE("uniqueness signal ignores case and empty labels", "[header][signal]") {
  REQUIRE(headerUniquenessScore(makeRow(0, {"Name", "name", "Age", ""})) == Catch::Approx(2.0 / 3.0));
  REQUIRE(headerUniquenessScore(makeRow(0, {"A", "B", "C"})) == Catch::Approx(1.0));
  REQUIRE(headerUniquenessScore(makeRow(0, {"", ""})) == 0.0);
}

TEST_CASE("detectHeader decides once", "[header]") {
  TableData table = makeTable({
    {"1250.50", "3400.75", "980.25"},
    {"1100.00", "2900.10", "875.40"},
  });
  detectHeader(table);
  REQUIRE_FALSE(table.hasHeader);
  REQUIRE(table.headerEvaluated);

  table.rows[0] = makeRow(0, {"Name", "Status", "Code"});
  detectHeader(table);
  REQUIRE_FALSE(table.hasHeader);
  REQUIRE_FALSE(table.rows[0].isHeader);
}

TEST_CASE("content signal recognizes Cyrillic capitals", "[header][signal]") {
  // Two code points, so only capitalization can count.
  REQUIRE(headerContentScore(makeRow(0, {"Ид"})) == Catch::Approx(1.0));
  REQUIRE(headerContentScore(makeRow(0, {"ид"})) == 0.0);
}
