/***
 * Name: pyjudge::challenge
 * Purpose: Challenge definitions and the catalog that loads them.
 * Inputs:
 *   - JSON catalog text or file:
 *     {"challenges": [{"id", "title", "description", "difficulty", "module",
 *       "concept", "template", "solution", "hints": [...],
 *       "tests": [{"function", "args", "kwargs", "expected"}]}]}
 * Outputs:
 *   - Challenge records with paired test cases and expected values
 * Theory of Operation:
 *   JSON values map onto codec::Value (null, bool, integer, float, string,
 *   array -> list, object -> dict). Values JSON cannot spell (tuples, sets,
 *   bytes, non-string keys, ints beyond UINT64_MAX) are written as
 *   {"$literal": "<python literal>"}
 *   and decoded with the codec. Structural problems throw
 *   exceptions::ConfigError naming the offending path; an unreadable file
 *   throws exceptions::FileReadError.
 */
#pragma once

#include <string>
#include <vector>
#include "codec/Value.h"
#include "harness/TestCase.h"

namespace pyjudge::challenge {

struct Challenge {
  std::string id;
  std::string title;
  std::string description;
  int difficulty{1};
  std::string module;
  std::string topic; // catalog key "concept"
  std::string templateSource;
  std::string solution;
  std::vector<std::string> hints{};
  std::vector<harness::TestCase> testCases{};
  std::vector<codec::Value> expected{}; // paired with testCases by index
};

class Catalog {
 public:
  static Catalog fromJsonText(const std::string& text, const std::string& origin);
  static Catalog load(const std::string& path);

  const std::vector<Challenge>& challenges() const { return challenges_; }
  const Challenge* find(const std::string& id) const;

 private:
  std::vector<Challenge> challenges_{};
};

} // namespace pyjudge::challenge
