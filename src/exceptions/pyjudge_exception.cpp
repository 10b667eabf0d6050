/***
 * Name: pyjudge::exceptions::PyjudgeException
 * Purpose: Stored message and blame for all pyjudge exceptions.
 */
#include "pyjudge/exceptions/pyjudge_exception.h"

#include <string>
#include <utility>

namespace pyjudge::exceptions {

PyjudgeException::PyjudgeException(const Blame blame, std::string msg) noexcept
    : blame_(blame), message_(std::move(msg)) {}

const char* PyjudgeException::what() const noexcept { return message_.c_str(); }

}  // namespace pyjudge::exceptions
