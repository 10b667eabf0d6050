/***
 * Name: pyjudge::sandbox::detail::CaptureBuffer::append
 * Purpose: Bounded stream capture that keeps the newest bytes.
 */
#include "sandbox/detail/exec.h"

#include <cstddef>

namespace pyjudge::sandbox::detail {

void CaptureBuffer::append(const char* data, std::size_t size) {
  text.append(data, size);
  if (limit != 0 && text.size() > limit) {
    text.erase(0, text.size() - limit);
    truncated = true;
  }
}

} // namespace pyjudge::sandbox::detail
