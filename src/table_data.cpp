#include "table_data.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

std::string trimText(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

bool startsWithUppercase(const std::string& s, size_t pos) {
  if (pos >= s.size()) return false;
  unsigned char c = static_cast<unsigned char>(s[pos]);
  if (c < 0x80) return std::isupper(c) != 0;
  if (c == 0xD0 && pos + 1 < s.size()) {
    unsigned char n = static_cast<unsigned char>(s[pos + 1]);
    return n >= 0x80 && n <= 0xAF;
  }
  return false;
}

std::string lowercaseText(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      out.push_back(static_cast<char>(std::tolower(c)));
      continue;
    }
    // Cyrillic capitals: U+0400..U+042F, encoded D0 80..D0 AF.
    if (c == 0xD0 && i + 1 < s.size()) {
      unsigned char n = static_cast<unsigned char>(s[i + 1]);
      if (n >= 0x90 && n <= 0x9F) {
        out.push_back(static_cast<char>(0xD0));
        out.push_back(static_cast<char>(n + 0x20));
        ++i;
        continue;
      }
      if (n >= 0xA0 && n <= 0xAF) {
        out.push_back(static_cast<char>(0xD1));
        out.push_back(static_cast<char>(n - 0x20));
        ++i;
        continue;
      }
      if (n >= 0x80 && n <= 0x8F) {
        out.push_back(static_cast<char>(0xD1));
        out.push_back(static_cast<char>(n + 0x10));
        ++i;
        continue;
      }
    }
    out.push_back(static_cast<char>(c));
  }
  return out;
}

std::size_t utf8Length(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) n++;
  }
  return n;
}

CellFormatting CellFormatting::boldText() {
  CellFormatting f;
  f.bold = true;
  return f;
}

CellFormatting CellFormatting::italicText() {
  CellFormatting f;
  f.italic = true;
  return f;
}

bool CellFormatting::hasFormatting() const {
  return bold || italic || underline ||
         backgroundColor.has_value() || textColor.has_value() ||
         fontSize.has_value() || fontFamily.has_value();
}

std::string CellFormatting::applyToText(const std::string& text) const {
  std::string result = text;
  if (bold) result = "**" + result + "**";
  if (italic) result = "*" + result + "*";
  if (underline) result = "__" + result + "__";
  return result;
}

CellFormatting mergeFormatting(CellFormatting base, const CellFormatting& overlay) {
  base.bold = base.bold || overlay.bold;
  base.italic = base.italic || overlay.italic;
  base.underline = base.underline || overlay.underline;
  if (overlay.fontSize) base.fontSize = overlay.fontSize;
  if (overlay.fontFamily) base.fontFamily = overlay.fontFamily;
  if (overlay.textColor) base.textColor = overlay.textColor;
  if (overlay.backgroundColor) base.backgroundColor = overlay.backgroundColor;
  return base;
}

std::string highlightToHex(const std::string& highlight) {
  static const std::unordered_map<std::string, std::string> palette = {
    {"yellow", "#FFFF00"},      {"green", "#00FF00"},
    {"cyan", "#00FFFF"},        {"magenta", "#FF00FF"},
    {"blue", "#0000FF"},        {"red", "#FF0000"},
    {"darkblue", "#000080"},    {"darkcyan", "#008080"},
    {"darkgreen", "#008000"},   {"darkmagenta", "#800080"},
    {"darkred", "#800000"},     {"darkyellow", "#808000"},
    {"darkgray", "#808080"},    {"lightgray", "#C0C0C0"},
    {"black", "#000000"},
  };
  auto it = palette.find(lowercaseText(highlight));
  if (it != palette.end()) return it->second;
  return "#" + highlight;
}

TableCell::TableCell(std::string text)
  : content(std::move(text)), cellType(CellType::Data) {
  formattedContent = content;
}

TableCell::TableCell(std::string text, CellFormatting fmt)
  : content(std::move(text)), formatting(std::move(fmt)), cellType(CellType::Data) {
  formattedContent = content;
}

TableCell TableCell::empty() {
  return TableCell();
}

bool TableCell::isEmpty() const {
  return trimText(content).empty();
}

void TableCell::setMerged(std::optional<std::size_t> cols, std::optional<std::size_t> rows) {
  cellType = CellType::Merged;
  colspan = cols;
  rowspan = rows;
}

std::size_t TableCell::contentLength() const {
  return utf8Length(content);
}

TableRow::TableRow(std::size_t index, std::size_t cellCapacity) : rowIndex(index) {
  cells.reserve(cellCapacity);
}

void TableRow::addCell(TableCell cell) {
  cells.push_back(std::move(cell));
}

bool TableRow::isEmpty() const {
  return std::all_of(cells.begin(), cells.end(), [](const TableCell& c) { return c.isEmpty(); });
}

void TableRow::markAsHeader() {
  isHeader = true;
  for (auto& cell : cells) {
    if (!cell.isMerged()) cell.cellType = CellType::Header;
  }
}

std::vector<const TableCell*> TableRow::nonEmptyCells() const {
  std::vector<const TableCell*> out;
  for (const auto& cell : cells) {
    if (!cell.isEmpty()) out.push_back(&cell);
  }
  return out;
}

TableData::TableData(std::size_t rowCapacity) {
  rows.reserve(rowCapacity);
}

void TableData::addRow(TableRow row) {
  columnCount = std::max(columnCount, row.cells.size());
  rows.push_back(std::move(row));
  rowCount = rows.size();
}

const TableCell* TableData::getCell(std::size_t row, std::size_t col) const {
  if (row >= rows.size() || col >= rows[row].cells.size()) return nullptr;
  return &rows[row].cells[col];
}

const TableRow* TableData::getRow(std::size_t row) const {
  return row < rows.size() ? &rows[row] : nullptr;
}

std::vector<const TableCell*> TableData::getColumn(std::size_t col) const {
  std::vector<const TableCell*> out;
  out.reserve(rows.size());
  for (size_t r = 0; r < rows.size(); ++r) out.push_back(getCell(r, col));
  return out;
}

void TableData::setHeaders(std::vector<std::string> names) {
  hasHeader = true;
  headers = std::move(names);
}

void TableData::updateStatistics() {
  rowCount = rows.size();
  columnCount = 0;
  for (const auto& r : rows) columnCount = std::max(columnCount, r.cells.size());
}

const char* toString(CellType type) {
  switch (type) {
    case CellType::Header: return "header";
    case CellType::Data:   return "data";
    case CellType::Merged: return "merged";
    case CellType::Empty:  return "empty";
  }
  return "data";
}
