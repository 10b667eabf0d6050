/***
 * Name: pyjudge::screen::DenyList
 * Purpose: Module and token deny-lists consulted by the Screener.
 * Inputs: None (defaults) or caller-provided lists
 * Outputs: Immutable lists
 * Theory of Operation:
 *   modules holds dotted names; an import is denied when the entry equals
 *   the imported name or one of its dotted prefixes. tokens are matched as
 *   case-insensitive substrings of the raw source.
 */
#pragma once

#include <string>
#include <vector>

namespace pyjudge::screen {

struct DenyList {
  std::vector<std::string> modules;
  std::vector<std::string> tokens;

  // os/process/network/filesystem access, dynamic import machinery,
  // the __future__ shim; eval/exec/__import__/open( in the raw text.
  static DenyList defaults();
};

} // namespace pyjudge::screen
