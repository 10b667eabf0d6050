/***
 * Name: pyjudge::driver::ResolveCatalogPath
 * Purpose: Pick the challenge catalog file.
 * Theory of Operation: --challenges wins, then a non-empty
 *   $PYJUDGE_CHALLENGES, then the catalog shipped with the sources.
 */
#include "driver/app.h"

#include <string>

#ifndef PYJUDGE_DEFAULT_CATALOG
#define PYJUDGE_DEFAULT_CATALOG "data/challenges.json"
#endif

namespace pyjudge::driver {

auto ResolveCatalogPath(const cli::Options& opts, const config::EnvLookup& env) -> std::string {
  if (!opts.challengesPath.empty()) { return opts.challengesPath; }
  if (auto fromEnv = env("PYJUDGE_CHALLENGES"); fromEnv && !fromEnv->empty()) { return *fromEnv; }
  return PYJUDGE_DEFAULT_CATALOG;
}

}  // namespace pyjudge::driver
