/***
 * Name: pyjudge::analysis::CheckStyle
 * Purpose: PEP8-lite: line length and trailing whitespace.
 * Inputs: source
 * Outputs: StyleReport (score clamped at 0, feedback never empty)
 * Theory of Operation: Lines split on \n, \r\n and \r. Length counts code
 *   points. Line numbers are listed like a Python list, at most three.
 */
#include "analysis/Analysis.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "pyjudge/support/utf8.h"

namespace pyjudge::analysis {

namespace {
constexpr std::size_t kListedLines = 3;
constexpr double kLongLinePenalty = 0.1;
constexpr double kLongLinePenaltyCap = 0.3;
constexpr double kTrailingPenalty = 0.05;

std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\n' && text[i] != '\r') { continue; }
    lines.push_back(text.substr(start, i - start));
    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') { ++i; }
    start = i + 1;
  }
  if (start < text.size()) { lines.push_back(text.substr(start)); }
  return lines;
}

std::size_t codePointCount(std::string_view line) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < line.size()) {
    (void)support::NextCodePoint(line, pos);
    ++count;
  }
  return count;
}

bool hasTrailingWhitespace(std::string_view line) {
  if (line.empty()) { return false; }
  const char last = line.back();
  return last == ' ' || last == '\t' || last == '\v' || last == '\f';
}

std::string listFirst(const std::vector<std::size_t>& numbers) {
  std::string out = "[";
  const std::size_t shown = std::min(numbers.size(), kListedLines);
  for (std::size_t i = 0; i < shown; ++i) {
    if (i != 0) { out += ", "; }
    out += std::to_string(numbers[i]);
  }
  return out + "]";
}
} // namespace

StyleReport CheckStyle(const std::string& source) {
  StyleReport report;
  std::vector<std::size_t> longLines;
  std::vector<std::size_t> trailing;
  const auto lines = splitLines(source);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (codePointCount(lines[i]) > kMaxLineLength) { longLines.push_back(i + 1); }
    if (hasTrailingWhitespace(lines[i])) { trailing.push_back(i + 1); }
  }
  if (!longLines.empty()) {
    std::string line = "Lines " + listFirst(longLines) + " exceed 79 characters";
    if (longLines.size() > kListedLines) { line += " and more..."; }
    report.feedback.push_back(std::move(line));
    report.score -= std::min(kLongLinePenalty * static_cast<double>(longLines.size()), kLongLinePenaltyCap);
  }
  if (!trailing.empty()) {
    report.feedback.push_back("Trailing whitespace on lines " + listFirst(trailing));
    report.score -= kTrailingPenalty;
  }
  if (report.feedback.empty()) { report.feedback.emplace_back("PEP8 check OK"); }
  report.score = std::max(0.0, report.score);
  return report;
}

double PerformanceScore(std::chrono::duration<double> elapsed) {
  return std::max(0.0, 1.0 - std::min(elapsed.count() / 2.0, 1.0));
}

} // namespace pyjudge::analysis
