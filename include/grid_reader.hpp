#pragma once

#include "table_extractor.hpp"

#include <istream>
#include <string>
#include <vector>

// Splits a delimited-text document into table blocks. Blank lines (outside
// quoted cells) separate tables; each block keeps its original line breaks.
// Quotes are recognized as parseGridBlock recognizes them for the same delimiter.
std::vector<std::string> splitTableBlocks(std::istream& in, char delimiter = ',');

// Parses one block into rows of cells. Quoting follows CSV conventions: a cell
// starting with '"' runs to the closing quote, "" is a literal quote, and quoted
// cells may hold delimiters and line breaks. Cells wrapped in **...**, *...* or
// __...__ come back bold, italic or underlined with the markers removed.
// Throws TableExtractionError for an unterminated quoted cell.
RawGrid parseGridBlock(const std::string& block, char delimiter);

// '\t' for .tsv and .tab files, ',' for anything else.
char delimiterForPath(const std::string& path);

// Reads the file and splits it into table blocks.
// Throws std::runtime_error when the file cannot be opened.
std::vector<std::string> readTableBlocks(const std::string& path, char delimiter = ',');

// Number of text lines in a block, used to describe a table that failed to parse.
size_t blockLineCount(const std::string& block);
