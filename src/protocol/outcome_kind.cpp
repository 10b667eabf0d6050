/***
 * Name: pyjudge::protocol::to_string(OutcomeKind)
 */
#include "protocol/ExecutionOutcome.h"

namespace pyjudge::protocol {

const char* to_string(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::Success: return "success";
    case OutcomeKind::Failure: return "failure";
    case OutcomeKind::Timeout: return "timeout";
  }
  return "unknown";
}

} // namespace pyjudge::protocol
