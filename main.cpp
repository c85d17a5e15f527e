#include "grid_reader.hpp"
#include "header_detector.hpp"
#include "table_extractor.hpp"
#include "table_writer.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options] <input>\n"
            << "  --simple | --full           start from a preset configuration\n"
            << "  --mode=<simple|structured|formatted|full>\n"
            << "  --format=<text|csv|tsv|markdown|json|html>\n"
            << "  --headers | --no-headers    toggle header detection\n"
            << "  --formatting                keep bold/italic/underline markup\n"
            << "  --empty-cells               keep empty cells\n"
            << "  --merge=<ignore|preserve|expand>\n"
            << "  --delimiter=<tab|char>      input delimiter (default from extension)\n"
            << "  --out=<dir>                 write table_<n> files instead of stdout\n"
            << "  --verbose                   print header scores to stderr\n";
}

bool startsWith(const std::string& arg, const std::string& prefix) {
  return arg.rfind(prefix, 0) == 0;
}

char parseDelimiter(const std::string& value) {
  if (value == "tab" || value == "\\t") return '\t';
  if (value.size() != 1) {
    throw std::invalid_argument("delimiter must be 'tab' or a single character, got '" + value + "'");
  }
  return value[0];
}

void logTable(size_t index, const TableData& table) {
  std::cerr << "table " << index << ": " << table.rowCount << " rows x "
            << table.columnCount << " columns, header=" << (table.hasHeader ? "yes" : "no") << "\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string inputPath;
    std::string outDir;
    bool verbose = false;
    char delimiter = 0;
    TableExtractionConfig config;

    // Presets first so that individual flags can refine them.
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--simple") config = TableExtractionConfig::simple();
      else if (arg == "--full") config = TableExtractionConfig::full();
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--simple" || arg == "--full") {
        continue;
      } else if (startsWith(arg, "--mode=")) {
        config = config.withMode(parseExtractionMode(arg.substr(7)));
      } else if (startsWith(arg, "--format=")) {
        config = config.withOutputFormat(parseOutputFormat(arg.substr(9)));
      } else if (arg == "--headers") {
        config = config.withHeaders(true);
      } else if (arg == "--no-headers") {
        config = config.withHeaders(false);
      } else if (arg == "--formatting") {
        config = config.withFormatting(true);
      } else if (arg == "--empty-cells") {
        config = config.withEmptyCells(true);
      } else if (startsWith(arg, "--merge=")) {
        config = config.withMergeCellsHandling(parseMergeCellsHandling(arg.substr(8)));
      } else if (startsWith(arg, "--delimiter=")) {
        delimiter = parseDelimiter(arg.substr(12));
      } else if (startsWith(arg, "--out=")) {
        outDir = arg.substr(6);
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (startsWith(arg, "--")) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else if (inputPath.empty()) {
        inputPath = arg;
      }
    }

    if (inputPath.empty() || !std::filesystem::exists(inputPath)) {
      std::cerr << "Input not found: " << (inputPath.empty() ? "<none>" : inputPath) << "\n";
      printUsage(argv[0]);
      return 2;
    }
    if (delimiter == 0) delimiter = delimiterForPath(inputPath);

    const bool useFormatting = config.preserveFormatting;
    std::vector<std::string> blocks = readTableBlocks(inputPath, delimiter);
    std::vector<TableData> tables;

    for (size_t i = 0; i < blocks.size(); ++i) {
      try {
        TableData table = extractTable(parseGridBlock(blocks[i], delimiter), config);
        if (verbose) {
          logTable(i, table);
          for (const auto& s : scoreHeaderSignals(table)) {
            std::cerr << "  " << s.name << ": " << s.score << " (weight " << s.weight << ")\n";
          }
          std::cerr << "  confidence: " << headerConfidence(table) << "\n";
        }
        if (outDir.empty()) {
          std::cout << renderTable(table, config.outputFormat, useFormatting);
          if (config.outputFormat == TableOutputFormat::PlainText) std::cout << "\n";
          if (i + 1 < blocks.size()) std::cout << "\n";
        }
        tables.push_back(std::move(table));
      } catch (const TableExtractionError& ex) {
        std::cerr << "Warning: table " << i << ": " << ex.what() << "\n";
        if (outDir.empty()) {
          std::cout << tablePlaceholder(blockLineCount(blocks[i])) << "\n";
          if (i + 1 < blocks.size()) std::cout << "\n";
        }
      }
    }

    if (!outDir.empty()) {
      writeTables(tables, outDir, config.outputFormat, useFormatting);
      std::cout << "Extracted " << tables.size() << " table(s) to '" << outDir << "'\n";
    }
    return 0;
  } catch (const std::invalid_argument& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    printUsage(argv[0]);
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
