/***
 * Name: pyjudge::exceptions::TargetError
 * Purpose: Exception for call targets that cannot be expressed as a registry thunk.
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

class TargetError : public PyjudgeException {
 public:
  explicit TargetError(std::string msg) noexcept : PyjudgeException(Blame::Caller, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyjudge
