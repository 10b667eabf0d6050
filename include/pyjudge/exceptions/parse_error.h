/***
 * Name: pyjudge::exceptions::ParseError
 * Purpose: Exception for lexing/parsing failures of Python source and literals.
 * Inputs: Error message and the 1-based source position it refers to
 * Outputs: Exception object
 * Theory of Operation: what() carries "file:line:col: msg"; the bare message and
 *   position stay available for diagnostics rendering.
 */
#pragma once

#include <string>
#include <utility>

#include "pyjudge/exceptions/pyjudge_exception.h"

namespace pyjudge {
namespace exceptions {

class ParseError : public PyjudgeException {
 public:
  explicit ParseError(std::string msg) noexcept : PyjudgeException(Blame::Caller, msg), detail_(std::move(msg)) {}

  ParseError(const std::string& file, int line, int col, std::string msg) noexcept
      : PyjudgeException(Blame::Caller, file + ":" + std::to_string(line) + ":" + std::to_string(col) + ": " + msg),
        detail_(std::move(msg)), line_(line), col_(col) {}

  const std::string& detail() const noexcept { return detail_; }
  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  std::string detail_;
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace pyjudge
