/***
 * Name: pyjudge::config::EngineConfig
 * Purpose: Tunables of the execution engine.
 * Inputs:
 *   - Built-in defaults
 *   - Environment: PYJUDGE_TIMEOUT, PYJUDGE_MAX_CONCURRENT, PYJUDGE_PYTHON,
 *     PYJUDGE_TMPDIR, PYJUDGE_MAX_OUTPUT, PYJUDGE_MEMORY_MB
 *   - Command line values (applied last by the driver)
 * Outputs:
 *   - A validated config and the sandbox options derived from it
 * Theory of Operation:
 *   Each setter parses text strictly and throws exceptions::ConfigError
 *   naming the source of the bad value. Zero is invalid for the timeout,
 *   the concurrency cap and the output cap; zero memory means no cap. The
 *   timeout is capped at one day.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include "sandbox/ProcessRunner.h"

namespace pyjudge::config {

inline constexpr double kDefaultTimeoutSeconds = 5.0;
inline constexpr double kMaxTimeoutSeconds = 86400.0; // one day
inline constexpr std::size_t kDefaultMaxConcurrent = 5;
inline constexpr std::size_t kDefaultMaxOutputBytes = 1U << 20U;

struct EngineConfig {
  double timeoutSeconds{kDefaultTimeoutSeconds};
  std::size_t maxConcurrent{kDefaultMaxConcurrent};
  std::string interpreter{"python3"};
  std::string tempDir{};
  std::size_t maxOutputBytes{kDefaultMaxOutputBytes};
  std::uint64_t memoryLimitMb{0};

  sandbox::RunnerOptions runnerOptions() const;
};

// Returns the value of a variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/*** ProcessEnv: EnvLookup over the real process environment. */
EnvLookup ProcessEnv();

/*** LoadEngineConfig: Defaults overlaid with the environment. Throws exceptions::ConfigError. */
EngineConfig LoadEngineConfig(const EnvLookup& env);

// `source` names where the text came from, e.g. "PYJUDGE_TIMEOUT" or "--timeout".
void SetTimeout(EngineConfig& cfg, std::string_view text, const std::string& source);
void SetMaxConcurrent(EngineConfig& cfg, std::string_view text, const std::string& source);
void SetMaxOutput(EngineConfig& cfg, std::string_view text, const std::string& source);
void SetMemoryLimit(EngineConfig& cfg, std::string_view text, const std::string& source);
void SetInterpreter(EngineConfig& cfg, std::string_view text, const std::string& source);
void SetTempDir(EngineConfig& cfg, std::string_view text, const std::string& source);

/*** ParseSecondsStrict: Positive decimal seconds up to kMaxTimeoutSeconds; false with err otherwise. */
bool ParseSecondsStrict(std::string_view text, double& out, std::string& err);

} // namespace pyjudge::config
