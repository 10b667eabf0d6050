/***
 * Name: pyjudge::driver::BuildEngineConfig
 * Purpose: Layer CLI engine settings over the environment-derived config.
 * Inputs:
 *   - opts: raw CLI values
 *   - env: environment lookup
 * Outputs:
 *   - validated EngineConfig
 * Theory of Operation: Each CLI value goes through the same strict setter as
 *   its environment variable; errors name the flag.
 */
#include "driver/app.h"

namespace pyjudge::driver {

auto BuildEngineConfig(const cli::Options& opts, const config::EnvLookup& env) -> config::EngineConfig {
  config::EngineConfig cfg = config::LoadEngineConfig(env);
  if (opts.timeout) { config::SetTimeout(cfg, *opts.timeout, "--timeout"); }
  if (opts.maxConcurrent) { config::SetMaxConcurrent(cfg, *opts.maxConcurrent, "--max-concurrent"); }
  if (opts.python) { config::SetInterpreter(cfg, *opts.python, "--python"); }
  if (opts.tmpDir) { config::SetTempDir(cfg, *opts.tmpDir, "--tmpdir"); }
  if (opts.memoryMb) { config::SetMemoryLimit(cfg, *opts.memoryMb, "--memory-mb"); }
  return cfg;
}

}  // namespace pyjudge::driver
