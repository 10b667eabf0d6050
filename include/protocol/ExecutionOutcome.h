/***
 * Name: pyjudge::protocol::ExecutionOutcome
 * Purpose: Tri-state result of one sandboxed run.
 * Theory of Operation: Success carries the repr() text, Failure a message,
 *   Timeout the limit that was exceeded. Built once per run; immutable.
 */
#pragma once

#include <string>
#include <utility>

namespace pyjudge::protocol {

enum class OutcomeKind { Success, Failure, Timeout };

const char* to_string(OutcomeKind kind);

class ExecutionOutcome {
 public:
  static ExecutionOutcome success(std::string resultText) {
    return ExecutionOutcome(OutcomeKind::Success, std::move(resultText), 0.0);
  }
  static ExecutionOutcome failure(std::string message) {
    return ExecutionOutcome(OutcomeKind::Failure, std::move(message), 0.0);
  }
  static ExecutionOutcome timeout(double limitSeconds) {
    return ExecutionOutcome(OutcomeKind::Timeout, std::string(), limitSeconds);
  }

  OutcomeKind kind() const { return kind_; }
  bool isSuccess() const { return kind_ == OutcomeKind::Success; }
  // Result text for Success, message for Failure, empty for Timeout.
  const std::string& text() const { return text_; }
  double limitSeconds() const { return limit_; }

 private:
  ExecutionOutcome(OutcomeKind kind, std::string text, double limit)
      : kind_(kind), text_(std::move(text)), limit_(limit) {}

  OutcomeKind kind_;
  std::string text_;
  double limit_;
};

} // namespace pyjudge::protocol
