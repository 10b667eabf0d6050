/***
 * Name: pyjudge::exceptions::PyjudgeException
 * Purpose: Base class for every exception pyjudge throws.
 * Theory of Operation: Each subclass states who is at fault. Caller errors
 *   (bad options, config, catalog or input files) map to exit status 2, host
 *   errors (pipes, fork, temp files) to 3. main() relies on blame() alone.
 */
#pragma once

#include <exception>
#include <string>

namespace pyjudge {
namespace exceptions {

enum class Blame { Caller, Host };

class PyjudgeException : public std::exception {
 public:
  const char* what() const noexcept override;
  Blame blame() const noexcept { return blame_; }

 protected:
  PyjudgeException(Blame blame, std::string msg) noexcept;

 private:
  Blame blame_;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pyjudge
