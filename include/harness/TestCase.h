/***
 * Name: pyjudge::harness::TestCase
 * Purpose: One invocation of the candidate: target expression plus arguments.
 * Theory of Operation: An empty target means "run the source; success is
 *   reaching the end". Keyword arguments keep their declared order.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "codec/Value.h"

namespace pyjudge::harness {

struct TestCase {
  std::string target{};
  std::vector<codec::Value> args{};
  std::vector<std::pair<std::string, codec::Value>> kwargs{};
};

} // namespace pyjudge::harness
