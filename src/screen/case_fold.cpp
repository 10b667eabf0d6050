/***
 * Name: pyjudge::screen::CaseFold
 * Purpose: Case-insensitive matching support for the token scan.
 * Inputs: UTF-8 text
 * Outputs: Folded UTF-8 text
 * Theory of Operation: UTF-8 -> UTF-16 (with U+FFFD substitution), ICU full
 *   case folding, back to UTF-8. Each ICU call is sized with a preflight.
 *   On an ICU failure the input is returned unchanged.
 */
#include "screen/Screener.h"

#include <cstdint>
#include <string>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>

namespace pyjudge::screen {

std::string CaseFold(const std::string& text) {
  if (text.empty()) { return text; }
  constexpr UChar32 kReplacement = 0xFFFD;
  const char* data = text.data();
  const auto nb = static_cast<int32_t>(text.size());
  UErrorCode status = U_ZERO_ERROR;
  int32_t uLen = 0;
  u_strFromUTF8WithSub(nullptr, 0, &uLen, data, nb, kReplacement, nullptr, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return text; }
  status = U_ZERO_ERROR;
  std::vector<UChar> ustr(static_cast<size_t>(uLen) + 1);
  u_strFromUTF8WithSub(ustr.data(), uLen + 1, nullptr, data, nb, kReplacement, nullptr, &status);
  if (U_FAILURE(status)) { return text; }
  // Case fold (full)
  int32_t fLen = u_strFoldCase(nullptr, 0, ustr.data(), uLen, U_FOLD_CASE_DEFAULT, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return text; }
  status = U_ZERO_ERROR;
  std::vector<UChar> fbuf(static_cast<size_t>(fLen) + 1);
  u_strFoldCase(fbuf.data(), fLen + 1, ustr.data(), uLen, U_FOLD_CASE_DEFAULT, &status);
  if (U_FAILURE(status)) { return text; }
  // Convert back to UTF-8
  int32_t outLen = 0;
  u_strToUTF8(nullptr, 0, &outLen, fbuf.data(), fLen, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return text; }
  status = U_ZERO_ERROR;
  std::vector<char> out(static_cast<size_t>(outLen) + 1);
  u_strToUTF8(out.data(), outLen + 1, nullptr, fbuf.data(), fLen, &status);
  if (U_FAILURE(status)) { return text; }
  return std::string(out.data(), static_cast<size_t>(outLen));
}

} // namespace pyjudge::screen
