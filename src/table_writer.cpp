#include "table_writer.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

const std::string& cellText(const TableCell& cell, bool useFormatting) {
  return useFormatting ? cell.formattedContent : cell.content;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

std::string quoteDelimited(const std::string& cell, char delimiter) {
  bool needQuotes = cell.find(delimiter) != std::string::npos ||
                    cell.find('"') != std::string::npos ||
                    cell.find('\n') != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped = "\"";
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

std::string escapeMarkdown(const std::string& text) {
  std::string out;
  for (char ch : text) {
    if (ch == '|') out += "\\|";
    else if (ch == '\n') out += "<br>";
    else out += ch;
  }
  return out;
}

std::string escapeJson(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  for (char ch : text) {
    switch (ch) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  return out;
}

std::string escapeHtml(const std::string& text) {
  std::string out;
  for (char ch : text) {
    switch (ch) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += ch;
    }
  }
  return out;
}

// A merged cell without a span is drawn by its anchor, expanded or not.
bool coveredByAnchor(const TableCell& cell) {
  return cell.isMerged() && !cell.colspan && !cell.rowspan;
}

} // namespace

std::string renderPlainText(const TableData& table, bool useFormatting) {
  std::string result;
  if (table.headers) {
    result += join(*table.headers, " | ");
    result += '\n';
    result += std::string(table.headers->size() * 10, '-');
    result += '\n';
  }
  for (const auto& row : table.rows) {
    if (table.hasHeader && row.isHeader) continue;
    if (row.isEmpty()) continue;
    std::vector<std::string> texts;
    for (const auto& cell : row.cells) texts.push_back(trimText(cellText(cell, useFormatting)));
    result += join(texts, " | ");
    result += '\n';
  }
  return trimText(result);
}

std::string renderDelimited(const TableData& table, char delimiter, bool useFormatting) {
  std::string out;
  for (const auto& row : table.rows) {
    for (size_t i = 0; i < row.cells.size(); ++i) {
      out += quoteDelimited(cellText(row.cells[i], useFormatting), delimiter);
      if (i + 1 < row.cells.size()) out += delimiter;
    }
    out += '\n';
  }
  return out;
}

std::string renderMarkdown(const TableData& table, bool useFormatting) {
  if (table.rows.empty() || table.columnCount == 0) return "";
  std::string out;
  const size_t cols = table.columnCount;
  for (size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    out += '|';
    for (size_t c = 0; c < cols; ++c) {
      std::string text = c < row.cells.size() ? escapeMarkdown(cellText(row.cells[c], useFormatting)) : "";
      out += ' ' + text + " |";
    }
    out += '\n';
    if (r == 0) {
      out += '|';
      for (size_t c = 0; c < cols; ++c) out += " --- |";
      out += '\n';
    }
  }
  return out;
}

std::string renderJson(const TableData& table, bool useFormatting) {
  std::ostringstream os;
  os << "{\n";
  if (table.title) os << "  \"title\": \"" << escapeJson(*table.title) << "\",\n";
  if (table.tableId) os << "  \"tableId\": \"" << escapeJson(*table.tableId) << "\",\n";
  os << "  \"hasHeader\": " << (table.hasHeader ? "true" : "false") << ",\n";
  os << "  \"headers\": ";
  if (table.headers) {
    os << "[";
    for (size_t i = 0; i < table.headers->size(); ++i) {
      os << "\"" << escapeJson((*table.headers)[i]) << "\"" << (i + 1 == table.headers->size() ? "" : ", ");
    }
    os << "],\n";
  } else {
    os << "null,\n";
  }
  os << "  \"rowCount\": " << table.rowCount << ",\n";
  os << "  \"columnCount\": " << table.columnCount << ",\n";
  os << "  \"rows\": [";
  for (size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    os << (r == 0 ? "\n" : ",\n");
    os << "    {\"rowIndex\": " << row.rowIndex
       << ", \"isHeader\": " << (row.isHeader ? "true" : "false")
       << ", \"cells\": [";
    for (size_t c = 0; c < row.cells.size(); ++c) {
      const auto& cell = row.cells[c];
      os << "{\"content\": \"" << escapeJson(cellText(cell, useFormatting)) << "\""
         << ", \"type\": \"" << toString(cell.cellType) << "\"";
      if (cell.colspan) os << ", \"colspan\": " << *cell.colspan;
      if (cell.rowspan) os << ", \"rowspan\": " << *cell.rowspan;
      os << "}" << (c + 1 == row.cells.size() ? "" : ", ");
    }
    os << "]}";
  }
  os << (table.rows.empty() ? "]\n" : "\n  ]\n");
  os << "}\n";
  return os.str();
}

std::string renderHtml(const TableData& table, bool useFormatting) {
  std::ostringstream os;
  os << "<table>\n";
  bool bodyOpen = false;
  for (const auto& row : table.rows) {
    const bool header = table.hasHeader && row.isHeader;
    if (header) {
      os << "  <thead>\n";
    } else if (!bodyOpen) {
      os << "  <tbody>\n";
      bodyOpen = true;
    }
    const char* tag = header ? "th" : "td";
    os << "    <tr>";
    for (const auto& cell : row.cells) {
      if (coveredByAnchor(cell)) continue;
      os << "<" << tag;
      if (cell.colspan) os << " colspan=\"" << *cell.colspan << "\"";
      if (cell.rowspan) os << " rowspan=\"" << *cell.rowspan << "\"";
      os << ">" << escapeHtml(cellText(cell, useFormatting)) << "</" << tag << ">";
    }
    os << "</tr>\n";
    if (header) os << "  </thead>\n";
  }
  if (bodyOpen) os << "  </tbody>\n";
  os << "</table>\n";
  return os.str();
}

std::string renderTable(const TableData& table, TableOutputFormat format, bool useFormatting) {
  switch (format) {
    case TableOutputFormat::PlainText: return renderPlainText(table, useFormatting);
    case TableOutputFormat::Csv:       return renderDelimited(table, ',', useFormatting);
    case TableOutputFormat::Tsv:       return renderDelimited(table, '\t', useFormatting);
    case TableOutputFormat::Markdown:  return renderMarkdown(table, useFormatting);
    case TableOutputFormat::Json:      return renderJson(table, useFormatting);
    case TableOutputFormat::Html:      return renderHtml(table, useFormatting);
  }
  return renderPlainText(table, useFormatting);
}

std::string tablePlaceholder(size_t rowCount) {
  return "[Table with " + std::to_string(rowCount) + " rows]";
}

void writeTables(const std::vector<TableData>& tables, const std::string& outDir,
                 TableOutputFormat format, bool useFormatting) {
  if (!std::filesystem::exists(outDir)) {
    std::filesystem::create_directories(outDir);
  }
  for (size_t i = 0; i < tables.size(); ++i) {
    std::string filename = outDir + "/table_" + std::to_string(i) + "." + fileExtension(format);
    std::ofstream ofs(filename);
    if (!ofs) {
      throw std::runtime_error("Cannot write " + filename);
    }
    ofs << renderTable(tables[i], format, useFormatting);
    if (format == TableOutputFormat::PlainText) ofs << "\n";
  }
}
