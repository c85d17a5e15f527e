#pragma once

#include <string>

// How much fidelity renderers should attempt. The inference passes ignore it.
enum class TableExtractionMode {
  Simple,
  Structured,
  Formatted,
  Full,
};

enum class MergeCellsHandling {
  Ignore,
  Preserve,
  Expand,
};

enum class TableOutputFormat {
  PlainText,
  Csv,
  Tsv,
  Markdown,
  Json,
  Html,
};

struct TableExtractionConfig {
  TableExtractionMode mode = TableExtractionMode::Structured;
  bool detectHeaders = true;
  bool preserveFormatting = false;
  bool includeEmptyCells = false;
  MergeCellsHandling mergeCellsHandling = MergeCellsHandling::Preserve;
  TableOutputFormat outputFormat = TableOutputFormat::PlainText;

  // Plain text only: no header detection, merges ignored.
  static TableExtractionConfig simple();
  // Everything on, JSON output.
  static TableExtractionConfig full();

  TableExtractionConfig withHeaders(bool detect) const;
  TableExtractionConfig withFormatting(bool preserve) const;
  TableExtractionConfig withEmptyCells(bool include) const;
  TableExtractionConfig withMode(TableExtractionMode m) const;
  TableExtractionConfig withMergeCellsHandling(MergeCellsHandling handling) const;
  TableExtractionConfig withOutputFormat(TableOutputFormat format) const;
};

// Case-insensitive name lookups used by the command line.
// Throw std::invalid_argument for unknown names.
TableExtractionMode parseExtractionMode(const std::string& name);
MergeCellsHandling parseMergeCellsHandling(const std::string& name);
TableOutputFormat parseOutputFormat(const std::string& name);

const char* toString(TableExtractionMode mode);
const char* toString(MergeCellsHandling handling);
const char* toString(TableOutputFormat format);

// File extension (without dot) used when writing a table in the given format.
const char* fileExtension(TableOutputFormat format);
