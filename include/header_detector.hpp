#pragma once

#include "table_data.hpp"

#include <string>
#include <vector>

// Confidence above which row 0 is treated as a header row.
constexpr double kHeaderConfidenceThreshold = 0.6;

struct HeaderSignalScore {
  std::string name;
  double score;   // normalized to [0, 1]
  double weight;
};

// Scores every header signal (formatting, content, consistency, length, uniqueness)
// for row 0 of the table against the rows that follow it.
std::vector<HeaderSignalScore> scoreHeaderSignals(const TableData& table);

// Weighted mean of the signal scores. 0 for a table without rows.
double headerConfidence(const std::vector<HeaderSignalScore>& scores);
double headerConfidence(const TableData& table);

// Marks row 0 as the header row when the confidence exceeds the threshold,
// recording its trimmed contents as the table headers. Tables without rows,
// tables that already have a header and tables evaluated before are left untouched.
void detectHeader(TableData& table);

// The signals themselves. dataRows are the rows after the candidate header row.
double formattingDifferenceScore(const TableRow& first, const std::vector<TableRow>& dataRows);
double headerContentScore(const TableRow& first);
double dataTypeConsistencyScore(const std::vector<TableRow>& dataRows);
double textLengthScore(const TableRow& first, const std::vector<TableRow>& dataRows);
double headerUniquenessScore(const TableRow& first);
