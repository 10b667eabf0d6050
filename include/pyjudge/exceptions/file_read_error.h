/***
 * Name: pyjudge::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
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

class FileReadError : public PyjudgeException {
 public:
  explicit FileReadError(std::string msg) noexcept : PyjudgeException(Blame::Caller, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyjudge
