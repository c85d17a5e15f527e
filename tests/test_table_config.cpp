#include <catch2/catch_all.hpp>

#include "table_config.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("default configuration", "[config]") {
  TableExtractionConfig config;
  REQUIRE(config.mode == TableExtractionMode::Structured);
  REQUIRE(config.detectHeaders);
  REQUIRE_FALSE(config.preserveFormatting);
  REQUIRE_FALSE(config.includeEmptyCells);
  REQUIRE(config.mergeCellsHandling == MergeCellsHandling::Preserve);
  REQUIRE(config.outputFormat == TableOutputFormat::PlainText);
}

TEST_CASE("presets", "[config]") {
  auto simple = TableExtractionConfig::simple();
  REQUIRE(simple.mode == TableExtractionMode::Simple);
  REQUIRE_FALSE(simple.detectHeaders);
  REQUIRE_FALSE(simple.preserveFormatting);
  REQUIRE(simple.mergeCellsHandling == MergeCellsHandling::Ignore);

  auto full = TableExtractionConfig::full();
  REQUIRE(full.mode == TableExtractionMode::Full);
  REQUIRE(full.detectHeaders);
  REQUIRE(full.preserveFormatting);
  REQUIRE(full.includeEmptyCells);
  REQUIRE(full.outputFormat == TableOutputFormat::Json);
}

TEST_CASE("builders return modified copies", "[config]") {
  const TableExtractionConfig base;
  auto config = base.withHeaders(false)
                    .withFormatting(true)
                    .withEmptyCells(true)
                    .withMode(TableExtractionMode::Full)
                    .withMergeCellsHandling(MergeCellsHandling::Expand)
                    .withOutputFormat(TableOutputFormat::Html);

  REQUIRE_FALSE(config.detectHeaders);
  REQUIRE(config.preserveFormatting);
  REQUIRE(config.includeEmptyCells);
  REQUIRE(config.mode == TableExtractionMode::Full);
  REQUIRE(config.mergeCellsHandling == MergeCellsHandling::Expand);
  REQUIRE(config.outputFormat == TableOutputFormat::Html);

  REQUIRE(base.detectHeaders);
  REQUIRE(base.mode == TableExtractionMode::Structured);
}

TEST_CASE("command-line names map onto enums", "[config]") {
  REQUIRE(parseExtractionMode("Formatted") == TableExtractionMode::Formatted);
  REQUIRE(parseMergeCellsHandling("EXPAND") == MergeCellsHandling::Expand);
  REQUIRE(parseOutputFormat("md") == TableOutputFormat::Markdown);
  REQUIRE(parseOutputFormat("tsv") == TableOutputFormat::Tsv);
  REQUIRE(parseOutputFormat("text") == TableOutputFormat::PlainText);

  REQUIRE_THROWS_AS(parseExtractionMode("verbose"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseMergeCellsHandling("split"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseOutputFormat("xlsx"), std::invalid_argument);

  REQUIRE(std::string(toString(MergeCellsHandling::Preserve)) == "preserve");
  REQUIRE(std::string(fileExtension(TableOutputFormat::Markdown)) == "md");
  REQUIRE(parseOutputFormat(toString(TableOutputFormat::Json)) == TableOutputFormat::Json);
}
