#include "header_detector.hpp"

#include "cell_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_set>

namespace {

// Data rows inspected by any signal.
constexpr size_t kSampleRows = 5;
constexpr size_t kFormattingRows = 3;
constexpr size_t kLengthRows = 3;

using SignalFn = double (*)(const TableRow& first, const std::vector<TableRow>& dataRows);

struct HeaderSignal {
  const char* name;
  double weight;
  SignalFn score;
};

const HeaderSignal kSignals[] = {
  {"formatting", 0.30, formattingDifferenceScore},
  {"content", 0.25, [](const TableRow& first, const std::vector<TableRow>&) { return headerContentScore(first); }},
  {"consistency", 0.20, [](const TableRow&, const std::vector<TableRow>& data) { return dataTypeConsistencyScore(data); }},
  {"length", 0.15, textLengthScore},
  {"uniqueness", 0.10, [](const TableRow& first, const std::vector<TableRow>&) { return headerUniquenessScore(first); }},
};

bool isFormatted(const TableCell& cell) {
  return cell.formatting && cell.formatting->hasFormatting();
}

double averageLength(const TableRow& row) {
  if (row.cells.empty()) return 0.0;
  size_t total = 0;
  for (const auto& cell : row.cells) total += cell.contentLength();
  return static_cast<double>(total) / row.cells.size();
}

bool containsHeaderKeyword(const std::string& lower) {
  static const char* const keywords[] = {
    "name", "id", "title", "date", "time", "type", "status",
    "amount", "count", "number", "code", "description",
  };
  for (const char* k : keywords) {
    if (lower.find(k) != std::string::npos) return true;
  }
  return false;
}

bool hasCapitalizedWord(const std::string& text) {
  bool atWordStart = true;
  for (size_t i = 0; i < text.size(); ++i) {
    if (std::isspace(static_cast<unsigned char>(text[i]))) {
      atWordStart = true;
      continue;
    }
    if (atWordStart && startsWithUppercase(text, i)) return true;
    atWordStart = false;
  }
  return false;
}

size_t digitCount(const std::string& text) {
  return static_cast<size_t>(std::count_if(text.begin(), text.end(),
                                           [](unsigned char c) { return std::isdigit(c) != 0; }));
}

} // namespace

double formattingDifferenceScore(const TableRow& first, const std::vector<TableRow>& dataRows) {
  size_t differences = 0;
  size_t comparisons = 0;
  const size_t rowsToCheck = std::min(dataRows.size(), kFormattingRows);

  for (size_t col = 0; col < first.cells.size(); ++col) {
    const TableCell& head = first.cells[col];
    for (size_t r = 0; r < rowsToCheck; ++r) {
      if (col >= dataRows[r].cells.size()) continue;
      const TableCell& data = dataRows[r].cells[col];
      comparisons++;
      if (isFormatted(head) != isFormatted(data)) differences++;
      // Bold headers over plain data count twice.
      if (head.formatting && data.formatting && head.formatting->bold && !data.formatting->bold) {
        differences++;
      }
    }
  }
  if (comparisons == 0) return 0.0;
  return std::min(1.0, static_cast<double>(differences) / comparisons);
}

double headerContentScore(const TableRow& first) {
  if (first.cells.empty()) return 0.0;
  size_t indicators = 0;
  for (const auto& cell : first.cells) {
    const std::string text = trimText(cell.content);
    const std::string lower = lowercaseText(text);
    const size_t length = utf8Length(text);

    if (containsHeaderKeyword(lower)) indicators++;
    if (length > 2 && length < 30 && digitCount(text) <= 3) indicators++;
    if (hasCapitalizedWord(text)) indicators++;
  }
  return std::min(1.0, static_cast<double>(indicators) / first.cells.size());
}

double dataTypeConsistencyScore(const std::vector<TableRow>& dataRows) {
  const size_t rowsToCheck = std::min(dataRows.size(), kSampleRows);
  size_t maxCols = 0;
  for (size_t r = 0; r < rowsToCheck; ++r) maxCols = std::max(maxCols, dataRows[r].cells.size());

  double total = 0.0;
  size_t columns = 0;
  for (size_t col = 0; col < maxCols; ++col) {
    std::map<CellDataType, size_t> counts;
    size_t cells = 0;
    for (size_t r = 0; r < rowsToCheck; ++r) {
      if (col >= dataRows[r].cells.size()) continue;
      counts[classifyCell(dataRows[r].cells[col].content)]++;
      cells++;
    }
    if (cells == 0) continue;
    size_t majority = 0;
    for (const auto& kv : counts) majority = std::max(majority, kv.second);
    total += static_cast<double>(majority) / cells;
    columns++;
  }
  return columns > 0 ? total / columns : 0.0;
}

double textLengthScore(const TableRow& first, const std::vector<TableRow>& dataRows) {
  if (dataRows.empty()) return 0.0;
  const double firstAvg = averageLength(first);

  double dataAvg = 0.0;
  size_t counted = 0;
  const size_t rowsToCheck = std::min(dataRows.size(), kLengthRows);
  for (size_t r = 0; r < rowsToCheck; ++r) {
    if (dataRows[r].cells.empty()) continue;
    dataAvg += averageLength(dataRows[r]);
    counted++;
  }
  if (counted > 0) {
    dataAvg /= counted;
    if (firstAvg > 0.0 && firstAvg < 50.0 && dataAvg > firstAvg * 1.2) return 0.8;
  }
  return (firstAvg > 0.0 && firstAvg < 30.0) ? 0.4 : 0.0;
}

double headerUniquenessScore(const TableRow& first) {
  std::vector<std::string> names;
  for (const auto& cell : first.cells) {
    std::string lower = lowercaseText(trimText(cell.content));
    if (!lower.empty()) names.push_back(std::move(lower));
  }
  if (names.empty()) return 0.0;
  std::unordered_set<std::string> distinct(names.begin(), names.end());
  return static_cast<double>(distinct.size()) / names.size();
}

std::vector<HeaderSignalScore> scoreHeaderSignals(const TableData& table) {
  std::vector<HeaderSignalScore> scores;
  if (table.rows.empty()) return scores;

  const TableRow& first = table.rows.front();
  const size_t sampleEnd = std::min(table.rows.size(), kSampleRows + 1);
  const std::vector<TableRow> dataRows(table.rows.begin() + 1, table.rows.begin() + sampleEnd);

  for (const auto& signal : kSignals) {
    scores.push_back(HeaderSignalScore{signal.name, signal.score(first, dataRows), signal.weight});
  }
  return scores;
}

double headerConfidence(const std::vector<HeaderSignalScore>& scores) {
  double weighted = 0.0;
  double weights = 0.0;
  for (const auto& s : scores) {
    weighted += s.score * s.weight;
    weights += s.weight;
  }
  return weights > 0.0 ? weighted / weights : 0.0;
}

double headerConfidence(const TableData& table) {
  return headerConfidence(scoreHeaderSignals(table));
}

void detectHeader(TableData& table) {
  if (table.rows.empty() || table.hasHeader || table.headerEvaluated) return;
  table.headerEvaluated = true;
  if (headerConfidence(table) <= kHeaderConfidenceThreshold) return;

  TableRow& first = table.rows.front();
  std::vector<std::string> names;
  names.reserve(first.cells.size());
  for (const auto& cell : first.cells) names.push_back(trimText(cell.content));
  table.setHeaders(std::move(names));
  first.markAsHeader();
}
