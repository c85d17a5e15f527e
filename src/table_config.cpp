#include "table_config.hpp"

#include "table_data.hpp"

#include <stdexcept>

TableExtractionConfig TableExtractionConfig::simple() {
  TableExtractionConfig c;
  c.mode = TableExtractionMode::Simple;
  c.detectHeaders = false;
  c.preserveFormatting = false;
  c.includeEmptyCells = false;
  c.mergeCellsHandling = MergeCellsHandling::Ignore;
  c.outputFormat = TableOutputFormat::PlainText;
  return c;
}

TableExtractionConfig TableExtractionConfig::full() {
  TableExtractionConfig c;
  c.mode = TableExtractionMode::Full;
  c.detectHeaders = true;
  c.preserveFormatting = true;
  c.includeEmptyCells = true;
  c.mergeCellsHandling = MergeCellsHandling::Preserve;
  c.outputFormat = TableOutputFormat::Json;
  return c;
}

TableExtractionConfig TableExtractionConfig::withHeaders(bool detect) const {
  TableExtractionConfig c = *this;
  c.detectHeaders = detect;
  return c;
}

TableExtractionConfig TableExtractionConfig::withFormatting(bool preserve) const {
  TableExtractionConfig c = *this;
  c.preserveFormatting = preserve;
  return c;
}

TableExtractionConfig TableExtractionConfig::withEmptyCells(bool include) const {
  TableExtractionConfig c = *this;
  c.includeEmptyCells = include;
  return c;
}

TableExtractionConfig TableExtractionConfig::withMode(TableExtractionMode m) const {
  TableExtractionConfig c = *this;
  c.mode = m;
  return c;
}

TableExtractionConfig TableExtractionConfig::withMergeCellsHandling(MergeCellsHandling handling) const {
  TableExtractionConfig c = *this;
  c.mergeCellsHandling = handling;
  return c;
}

TableExtractionConfig TableExtractionConfig::withOutputFormat(TableOutputFormat format) const {
  TableExtractionConfig c = *this;
  c.outputFormat = format;
  return c;
}

TableExtractionMode parseExtractionMode(const std::string& name) {
  std::string n = lowercaseText(name);
  if (n == "simple") return TableExtractionMode::Simple;
  if (n == "structured") return TableExtractionMode::Structured;
  if (n == "formatted") return TableExtractionMode::Formatted;
  if (n == "full") return TableExtractionMode::Full;
  throw std::invalid_argument("unknown extraction mode '" + name + "' (expected simple, structured, formatted or full)");
}

MergeCellsHandling parseMergeCellsHandling(const std::string& name) {
  std::string n = lowercaseText(name);
  if (n == "ignore") return MergeCellsHandling::Ignore;
  if (n == "preserve") return MergeCellsHandling::Preserve;
  if (n == "expand") return MergeCellsHandling::Expand;
  throw std::invalid_argument("unknown merge handling '" + name + "' (expected ignore, preserve or expand)");
}

TableOutputFormat parseOutputFormat(const std::string& name) {
  std::string n = lowercaseText(name);
  if (n == "text" || n == "plain" || n == "plaintext") return TableOutputFormat::PlainText;
  if (n == "csv") return TableOutputFormat::Csv;
  if (n == "tsv") return TableOutputFormat::Tsv;
  if (n == "markdown" || n == "md") return TableOutputFormat::Markdown;
  if (n == "json") return TableOutputFormat::Json;
  if (n == "html") return TableOutputFormat::Html;
  throw std::invalid_argument("unknown output format '" + name + "' (expected text, csv, tsv, markdown, json or html)");
}

const char* toString(TableExtractionMode mode) {
  switch (mode) {
    case TableExtractionMode::Simple:     return "simple";
    case TableExtractionMode::Structured: return "structured";
    case TableExtractionMode::Formatted:  return "formatted";
    case TableExtractionMode::Full:       return "full";
  }
  return "structured";
}

const char* toString(MergeCellsHandling handling) {
  switch (handling) {
    case MergeCellsHandling::Ignore:   return "ignore";
    case MergeCellsHandling::Preserve: return "preserve";
    case MergeCellsHandling::Expand:   return "expand";
  }
  return "preserve";
}

const char* toString(TableOutputFormat format) {
  switch (format) {
    case TableOutputFormat::PlainText: return "text";
    case TableOutputFormat::Csv:       return "csv";
    case TableOutputFormat::Tsv:       return "tsv";
    case TableOutputFormat::Markdown:  return "markdown";
    case TableOutputFormat::Json:      return "json";
    case TableOutputFormat::Html:      return "html";
  }
  return "text";
}

const char* fileExtension(TableOutputFormat format) {
  switch (format) {
    case TableOutputFormat::PlainText: return "txt";
    case TableOutputFormat::Csv:       return "csv";
    case TableOutputFormat::Tsv:       return "tsv";
    case TableOutputFormat::Markdown:  return "md";
    case TableOutputFormat::Json:      return "json";
    case TableOutputFormat::Html:      return "html";
  }
  return "txt";
}
