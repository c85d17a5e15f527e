#pragma once

#include "table_config.hpp"
#include "table_data.hpp"

#include <string>
#include <vector>

// Renders the table in the given format. With useFormatting the cells'
// formattedContent is written instead of their plain content.
std::string renderTable(const TableData& table, TableOutputFormat format, bool useFormatting = false);

std::string renderPlainText(const TableData& table, bool useFormatting = false);
std::string renderDelimited(const TableData& table, char delimiter, bool useFormatting = false);
std::string renderMarkdown(const TableData& table, bool useFormatting = false);
std::string renderJson(const TableData& table, bool useFormatting = false);
std::string renderHtml(const TableData& table, bool useFormatting = false);

// Stand-in text for a table that could not be extracted.
std::string tablePlaceholder(size_t rowCount);

// Write tables into outDir as table_<index>.<ext>, creating outDir if needed.
// Throws std::runtime_error when a file cannot be written.
void writeTables(const std::vector<TableData>& tables, const std::string& outDir,
                 TableOutputFormat format, bool useFormatting = false);
