#include "grid_reader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

bool wrappedIn(const std::string& s, const std::string& marker) {
  const size_t m = marker.size();
  return s.size() > 2 * m &&
         s.compare(0, m, marker) == 0 &&
         s.compare(s.size() - m, m, marker) == 0;
}

RawCell decodeCell(const std::string& text) {
  std::string t = trimText(text);
  CellFormatting fmt;
  while (true) {
    if (wrappedIn(t, "**")) {
      fmt.bold = true;
      t = t.substr(2, t.size() - 4);
    } else if (wrappedIn(t, "__")) {
      fmt.underline = true;
      t = t.substr(2, t.size() - 4);
    } else if (wrappedIn(t, "*")) {
      fmt.italic = true;
      t = t.substr(1, t.size() - 2);
    } else {
      break;
    }
  }
  if (fmt.hasFormatting()) return RawCell(t, fmt);
  return RawCell(text);
}

// Same quoting rules as parseGridBlock: only a quote at the start of a cell opens one.
bool endsInsideQuotes(const std::string& line, char delimiter, bool inQuotes) {
  bool atCellStart = !inQuotes;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (inQuotes) {
      if (c != '"') continue;
      if (i + 1 < line.size() && line[i + 1] == '"') {
        ++i;
      } else {
        inQuotes = false;
      }
    } else if (c == '"' && atCellStart) {
      inQuotes = true;
      atCellStart = false;
    } else if (c == delimiter) {
      atCellStart = true;
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      atCellStart = false;
    }
  }
  return inQuotes;
}

} // namespace

std::vector<std::string> splitTableBlocks(std::istream& in, char delimiter) {
  std::vector<std::string> blocks;
  std::string current;
  std::string line;
  bool inQuotes = false;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!inQuotes && trimText(line).empty()) {
      if (!current.empty()) blocks.push_back(std::move(current));
      current.clear();
      continue;
    }
    if (!current.empty()) current += '\n';
    current += line;
    inQuotes = endsInsideQuotes(line, delimiter, inQuotes);
  }
  if (!current.empty()) blocks.push_back(std::move(current));
  return blocks;
}

RawGrid parseGridBlock(const std::string& block, char delimiter) {
  RawGrid grid;
  std::vector<RawCell> row;
  std::string cell;
  bool inQuotes = false;
  bool atCellStart = true;
  size_t line = 1;
  size_t quoteLine = 0;

  auto endCell = [&]() {
    row.push_back(decodeCell(cell));
    cell.clear();
    atCellStart = true;
  };
  auto endRow = [&]() {
    endCell();
    grid.push_back(std::move(row));
    row.clear();
  };

  for (size_t i = 0; i < block.size(); ++i) {
    char c = block[i];
    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < block.size() && block[i + 1] == '"') {
          cell += '"';
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        if (c == '\n') line++;
        cell += c;
      }
      continue;
    }

    if (c == '"' && atCellStart) {
      inQuotes = true;
      quoteLine = line;
      atCellStart = false;
    } else if (c == delimiter) {
      endCell();
    } else if (c == '\n') {
      endRow();
      line++;
    } else if (c == '\r') {
      // CRLF input
    } else {
      cell += c;
      if (!std::isspace(static_cast<unsigned char>(c))) atCellStart = false;
    }
  }

  if (inQuotes) {
    throw TableExtractionError("unterminated quoted cell starting on line " + std::to_string(quoteLine));
  }
  if (!block.empty() && block.back() != '\n') endRow();
  return grid;
}

char delimiterForPath(const std::string& path) {
  std::string ext = lowercaseText(std::filesystem::path(path).extension().string());
  if (ext == ".tsv" || ext == ".tab") return '\t';
  return ',';
}

std::vector<std::string> readTableBlocks(const std::string& path, char delimiter) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error("Cannot open input file: " + path);
  }
  return splitTableBlocks(ifs, delimiter);
}

size_t blockLineCount(const std::string& block) {
  if (block.empty()) return 0;
  return static_cast<size_t>(std::count(block.begin(), block.end(), '\n')) + 1;
}
