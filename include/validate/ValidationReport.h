/***
 * Name: pyjudge::validate::ValidationReport
 * Purpose: Aggregate verdict of one submission against a test suite.
 * Theory of Operation: feedback holds the user-facing lines, summary first,
 *   then one line per test case in input order. cases mirrors the per-case
 *   lines in structured form for collaborators that store or render them.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace pyjudge::validate {

enum class CaseStatus { Passed, Mismatch, Failed, TimedOut };

const char* to_string(CaseStatus status);

struct CaseResult {
  std::size_t index{0}; // 1-based
  CaseStatus status{CaseStatus::Failed};
  std::string message{}; // feedback line without the "Test i: " prefix
  std::chrono::milliseconds elapsed{0};
};

struct ValidationReport {
  bool allPassed{false};
  std::vector<std::string> feedback{};
  std::vector<CaseResult> cases{};

  std::size_t passCount() const;
};

} // namespace pyjudge::validate
