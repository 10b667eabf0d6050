/***
 * Name: pyjudge::screen::SafetyVerdict
 * Purpose: Outcome of pre-screening; reason is set exactly when rejected.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace pyjudge::screen {

struct SafetyVerdict {
  bool allowed{true};
  std::optional<std::string> reason{};

  static SafetyVerdict allow() { return SafetyVerdict{}; }
  static SafetyVerdict reject(std::string why) { return SafetyVerdict{false, std::move(why)}; }
};

} // namespace pyjudge::screen
