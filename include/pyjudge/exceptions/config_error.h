/***
 * Name: pyjudge::exceptions::ConfigError
 * Purpose: Exception for configuration, option and challenge definition errors.
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

class ConfigError : public PyjudgeException {
 public:
  explicit ConfigError(std::string msg) noexcept : PyjudgeException(Blame::Caller, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyjudge
