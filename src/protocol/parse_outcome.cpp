/***
 * Name: pyjudge::protocol::ParseOutcome
 * Purpose: Decode the single-line result record, falling back to stderr.
 * Inputs: captured streams, runner flags, limit
 * Outputs: ExecutionOutcome
 * Theory of Operation: nlohmann::json::parse in non-throwing mode (allow
 *   exceptions off) yields a discarded value on malformed input, which takes
 *   the same fallback as a missing record.
 */
#include "protocol/Protocol.h"

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "pyjudge/support/parse_util.h"

namespace pyjudge::protocol {

namespace {
ExecutionOutcome fallback(const std::string& stderrText) {
  std::string_view trimmed(stderrText);
  support::TrimSpaces(trimmed);
  if (trimmed.empty()) { return ExecutionOutcome::failure("no output"); }
  return ExecutionOutcome::failure(std::string(trimmed));
}

std::string fieldText(const nlohmann::json& record, const char* key, const char* missing) {
  const auto it = record.find(key);
  if (it == record.end() || it->is_null()) { return missing; }
  if (it->is_string()) { return it->get<std::string>(); }
  return it->dump();
}
} // namespace

ExecutionOutcome ParseOutcome(const std::string& stdoutText, const std::string& stderrText, bool timedOut,
                              const std::optional<std::string>& spawnError, double limitSeconds) {
  if (timedOut) { return ExecutionOutcome::timeout(limitSeconds); }
  if (spawnError) { return ExecutionOutcome::failure(*spawnError); }

  const std::string line = LastNonEmptyLine(stdoutText);
  if (line.empty()) { return fallback(stderrText); }

  const nlohmann::json record = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (record.is_discarded() || !record.is_object()) { return fallback(stderrText); }
  const auto success = record.find("success");
  if (success == record.end() || !success->is_boolean()) { return fallback(stderrText); }

  if (success->get<bool>()) {
    return ExecutionOutcome::success(fieldText(record, "result", "None"));
  }
  return ExecutionOutcome::failure(fieldText(record, "error", "unknown error"));
}

} // namespace pyjudge::protocol
