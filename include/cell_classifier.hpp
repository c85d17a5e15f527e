#pragma once

#include <string>

enum class CellDataType {
  Empty,
  Number,
  Text,
  Date,
  Boolean,
};

struct ClassifierOptions {
  // "0" and "1" are boolean flags rather than numbers.
  bool binaryDigitsAsBoolean = true;
};

// Infers the semantic type of a cell from its text. Checks run in order
// empty, binary digit, number, date, boolean; anything else is Text.
CellDataType classifyCell(const std::string& text, const ClassifierOptions& options = {});

const char* toString(CellDataType type);

// Individual checks, applied to already trimmed text.

// Strict float syntax: optional sign, digits with optional fraction, optional exponent,
// or inf/infinity/nan. No surrounding whitespace, no hex.
bool parsesAsFloat(const std::string& text);

bool isNumericText(const std::string& text);
bool isCurrencyPattern(const std::string& text);
bool isPercentagePattern(const std::string& text);
bool isFormattedNumber(const std::string& text);
bool isScientificNotation(const std::string& text);

bool isDatePattern(const std::string& text);
bool isRelativeDate(const std::string& text);

bool isBooleanToken(const std::string& text);
