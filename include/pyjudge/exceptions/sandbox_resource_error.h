/***
 * Name: pyjudge::exceptions::SandboxResourceError
 * Purpose: Exception for host resource exhaustion in the sandbox (temp files, pipes, fork).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyjudgeException.
 */
#pragma once

#include <string>
#include <utility>

#include "pyjudge/exceptions/pyjudge_exception.h"

namespace pyjudge {
namespace exceptions {

class SandboxResourceError : public PyjudgeException {
 public:
  explicit SandboxResourceError(std::string msg) noexcept : PyjudgeException(Blame::Host, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyjudge
