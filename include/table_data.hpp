#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class CellType {
  Header,
  Data,
  Merged,
  Empty,
};

enum class CellAlignment {
  Left,
  Center,
  Right,
  Justify,
};

struct CellFormatting {
  bool bold = false;
  bool italic = false;
  bool underline = false;
  std::optional<std::string> backgroundColor;  // #RRGGBB
  std::optional<std::string> textColor;        // #RRGGBB
  std::optional<unsigned int> fontSize;        // points
  std::optional<std::string> fontFamily;

  static CellFormatting boldText();
  static CellFormatting italicText();

  bool hasFormatting() const;

  // Wraps text in markdown-style markers: ** for bold, * for italic, __ for underline.
  std::string applyToText(const std::string& text) const;
};

// Combines two formatting records; flags are OR-ed and the overlay's optional values win.
CellFormatting mergeFormatting(CellFormatting base, const CellFormatting& overlay);

// Maps a Word highlight colour name (case-insensitive) to #RRGGBB.
// Unknown names are assumed to already be hex digits and get a '#' prefix.
std::string highlightToHex(const std::string& highlight);

struct TableCell {
  std::string content;
  std::string formattedContent;
  std::optional<std::size_t> colspan;
  std::optional<std::size_t> rowspan;
  std::optional<CellAlignment> alignment;
  std::optional<CellFormatting> formatting;
  CellType cellType = CellType::Empty;

  TableCell() = default;
  explicit TableCell(std::string text);
  TableCell(std::string text, CellFormatting fmt);

  static TableCell empty();

  bool isEmpty() const;
  bool isMerged() const { return cellType == CellType::Merged; }
  bool isHeader() const { return cellType == CellType::Header; }

  void setMerged(std::optional<std::size_t> cols, std::optional<std::size_t> rows);

  // Length of content in code points, not bytes.
  std::size_t contentLength() const;
};

struct TableRow {
  std::vector<TableCell> cells;
  bool isHeader = false;
  std::size_t rowIndex = 0;

  explicit TableRow(std::size_t index, std::size_t cellCapacity = 0);

  void addCell(TableCell cell);
  std::size_t cellCount() const { return cells.size(); }

  // True when the row has no cells or every cell is empty.
  bool isEmpty() const;

  // Merged cells keep their type and spans.
  void markAsHeader();
  std::vector<const TableCell*> nonEmptyCells() const;
};

struct TableData {
  std::vector<TableRow> rows;
  std::optional<std::vector<std::string>> headers;
  bool hasHeader = false;
  std::size_t columnCount = 0;
  std::size_t rowCount = 0;
  std::optional<std::string> tableId;
  std::optional<std::string> title;
  // Set once header detection has run, whatever it decided.
  bool headerEvaluated = false;

  TableData() = default;
  explicit TableData(std::size_t rowCapacity);

  void addRow(TableRow row);
  bool isEmpty() const { return rows.empty(); }

  // Returns nullptr when the position is outside the table.
  const TableCell* getCell(std::size_t row, std::size_t col) const;
  const TableRow* getRow(std::size_t row) const;

  // One entry per row; nullptr where the row has no cell at col.
  std::vector<const TableCell*> getColumn(std::size_t col) const;

  void setHeaders(std::vector<std::string> names);

  // Recomputes rowCount and columnCount from rows.
  void updateStatistics();
};

const char* toString(CellType type);

// Strips leading and trailing ASCII whitespace.
std::string trimText(const std::string& s);

// Lowercases ASCII and Cyrillic capitals; other bytes are copied unchanged.
std::string lowercaseText(const std::string& s);

// True when the code point at byte offset pos is an ASCII or Cyrillic capital.
bool startsWithUppercase(const std::string& s, std::size_t pos);

// Number of UTF-8 code points in s.
std::size_t utf8Length(const std::string& s);
