#include "cell_classifier.hpp"

#include "table_data.hpp"

#include <cctype>
#include <regex>
#include <unordered_set>
#include <vector>

namespace {

const char* const kCurrencySymbols[] = {
  "$", "€", "¥", "£", "₹", "₽", "₩", "₪", "₦", "₡",
};

const char* const kCurrencyCodes[] = {
  "USD", "EUR", "GBP", "JPY", "CNY", "INR", "RUB", "KRW",
};

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string stripCommas(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c != ',') out.push_back(c);
  }
  return out;
}

std::vector<std::string> splitWhitespace(const std::string& s) {
  std::vector<std::string> parts;
  std::string cur;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!cur.empty()) parts.push_back(std::move(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) parts.push_back(std::move(cur));
  return parts;
}

} // namespace

bool parsesAsFloat(const std::string& text) {
  static const std::regex number("^[+-]?([0-9]+\\.?[0-9]*|\\.[0-9]+)([eE][+-]?[0-9]+)?$");
  static const std::regex special("^[+-]?(inf|infinity|nan)$", std::regex::icase);
  return std::regex_match(text, number) || std::regex_match(text, special);
}

bool isCurrencyPattern(const std::string& text) {
  for (const char* sym : kCurrencySymbols) {
    const std::string symbol(sym);
    if (!startsWith(text, symbol) && !endsWith(text, symbol)) continue;
    std::string rest = text;
    while (startsWith(rest, symbol)) rest.erase(0, symbol.size());
    while (endsWith(rest, symbol)) rest.erase(rest.size() - symbol.size());
    if (parsesAsFloat(stripCommas(trimText(rest)))) return true;
  }

  for (const char* c : kCurrencyCodes) {
    const std::string code(c);
    if (!startsWith(text, code) && !endsWith(text, code)) continue;
    std::vector<std::string> parts = splitWhitespace(text);
    if (parts.size() != 2) continue;
    if (parts[0] == code && parsesAsFloat(stripCommas(parts[1]))) return true;
    if (parts[1] == code && parsesAsFloat(stripCommas(parts[0]))) return true;
  }
  return false;
}

bool isPercentagePattern(const std::string& text) {
  if (!endsWith(text, "%")) return false;
  std::string number = text;
  while (endsWith(number, "%")) number.pop_back();
  return parsesAsFloat(number);
}

bool isFormattedNumber(const std::string& text) {
  if (text.find(',') == std::string::npos) return false;
  return parsesAsFloat(stripCommas(text));
}

bool isScientificNotation(const std::string& text) {
  if (text.find_first_of("eE") == std::string::npos) return false;
  return parsesAsFloat(text);
}

bool isNumericText(const std::string& text) {
  return parsesAsFloat(text) ||
         isCurrencyPattern(text) ||
         isPercentagePattern(text) ||
         isFormattedNumber(text) ||
         isScientificNotation(text);
}

bool isRelativeDate(const std::string& text) {
  const std::string lower = lowercaseText(text);

  // Latin-script words must stand alone so that "known" or "hierarchy" stay text.
  static const std::regex words("\\b(today|tomorrow|yesterday|now|aujourd'hui|demain|hier)\\b");
  if (std::regex_search(lower, words)) return true;

  static const char* const nonLatin[] = {
    "今天", "明天", "昨天", "现在",
    "сегодня", "завтра", "вчера",
  };
  for (const char* term : nonLatin) {
    if (lower.find(term) != std::string::npos) return true;
  }

  static const std::regex relative[] = {
    std::regex("[0-9]+\\s+(day|week|month|year)s?\\s+(ago|from now)"),
    std::regex("(last|next)\\s+(week|month|year)"),
    std::regex("(this|past)\\s+(week|month|year)"),
  };
  for (const auto& re : relative) {
    if (std::regex_search(lower, re)) return true;
  }
  return false;
}

bool isDatePattern(const std::string& text) {
  static const std::regex patterns[] = {
    std::regex("^[0-9]{1,2}[/-][0-9]{1,2}[/-][0-9]{2,4}$"),
    std::regex("^[0-9]{4}[/-][0-9]{1,2}[/-][0-9]{1,2}$"),
    std::regex("^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}$"),
    std::regex("^[0-9]{1,2}\\.[0-9]{1,2}\\.[0-9]{2,4}$"),
    std::regex("^[0-9]{1,2}[/-][0-9]{1,2}[/-][0-9]{2,4}\\s+[0-9]{1,2}:[0-9]{2}(:[0-9]{2})?$"),
    std::regex("^(Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)[a-z]*\\s+[0-9]{1,2},?\\s+[0-9]{2,4}$"),
    std::regex("^[0-9]{1,2}\\s+(Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)[a-z]*\\s+[0-9]{2,4}$"),
    std::regex("^[0-9]{1,2}:[0-9]{2}(:[0-9]{2})?(\\s*(AM|PM))?$"),
  };
  for (const auto& re : patterns) {
    if (std::regex_match(text, re)) return true;
  }
  return isRelativeDate(text);
}

bool isBooleanToken(const std::string& text) {
  static const std::unordered_set<std::string> tokens = {
    "true", "false", "yes", "no",
    "✓", "✗", "☑", "☐", "x", "o",
    "0", "1",
    "是", "否", "有", "無",
    "oui", "non",
    "да", "нет",
  };
  return tokens.count(lowercaseText(text)) > 0;
}

CellDataType classifyCell(const std::string& text, const ClassifierOptions& options) {
  const std::string trimmed = trimText(text);
  if (trimmed.empty()) return CellDataType::Empty;

  if (options.binaryDigitsAsBoolean && (trimmed == "0" || trimmed == "1")) {
    return CellDataType::Boolean;
  }
  if (isNumericText(trimmed)) return CellDataType::Number;
  if (isDatePattern(trimmed)) return CellDataType::Date;
  if (isBooleanToken(trimmed)) return CellDataType::Boolean;
  return CellDataType::Text;
}

const char* toString(CellDataType type) {
  switch (type) {
    case CellDataType::Empty:   return "empty";
    case CellDataType::Number:  return "number";
    case CellDataType::Text:    return "text";
    case CellDataType::Date:    return "date";
    case CellDataType::Boolean: return "boolean";
  }
  return "text";
}
