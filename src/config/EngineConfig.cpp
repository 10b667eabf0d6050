/***
 * Name: pyjudge::config::EngineConfig (impl)
 * Purpose: Defaults, environment overlay and strict setters.
 */
#include "config/EngineConfig.h"

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "pyjudge/exceptions/config_error.h"
#include "pyjudge/support/parse.h"

namespace pyjudge::config {

namespace {
[[noreturn]] void invalid(const std::string& source, const std::string& why) {
  throw exceptions::ConfigError("invalid value for " + source + ": " + why);
}

std::uint64_t parseCount(std::string_view text, const std::string& source, bool allowZero) {
  std::uint64_t value = 0;
  std::string err;
  if (!support::ParseCountStrict(text, value, &err)) { invalid(source, err); }
  if (!allowZero && value == 0) { invalid(source, "value must be greater than zero"); }
  return value;
}
} // namespace

sandbox::RunnerOptions EngineConfig::runnerOptions() const {
  sandbox::RunnerOptions opts;
  opts.interpreter = interpreter;
  opts.tempDir = tempDir;
  opts.maxOutputBytes = maxOutputBytes;
  opts.memoryLimitMb = memoryLimitMb;
  return opts;
}

EnvLookup ProcessEnv() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) { return std::nullopt; }
    return std::string(value);
  };
}

EngineConfig LoadEngineConfig(const EnvLookup& env) {
  EngineConfig cfg;
  if (auto v = env("PYJUDGE_TIMEOUT")) { SetTimeout(cfg, *v, "PYJUDGE_TIMEOUT"); }
  if (auto v = env("PYJUDGE_MAX_CONCURRENT")) { SetMaxConcurrent(cfg, *v, "PYJUDGE_MAX_CONCURRENT"); }
  if (auto v = env("PYJUDGE_PYTHON")) { SetInterpreter(cfg, *v, "PYJUDGE_PYTHON"); }
  if (auto v = env("PYJUDGE_TMPDIR")) { SetTempDir(cfg, *v, "PYJUDGE_TMPDIR"); }
  if (auto v = env("PYJUDGE_MAX_OUTPUT")) { SetMaxOutput(cfg, *v, "PYJUDGE_MAX_OUTPUT"); }
  if (auto v = env("PYJUDGE_MEMORY_MB")) { SetMemoryLimit(cfg, *v, "PYJUDGE_MEMORY_MB"); }
  return cfg;
}

void SetTimeout(EngineConfig& cfg, std::string_view text, const std::string& source) {
  double seconds = 0.0;
  std::string err;
  if (!ParseSecondsStrict(text, seconds, err)) { invalid(source, err); }
  cfg.timeoutSeconds = seconds;
}

void SetMaxConcurrent(EngineConfig& cfg, std::string_view text, const std::string& source) {
  cfg.maxConcurrent = static_cast<std::size_t>(parseCount(text, source, false));
}

void SetMaxOutput(EngineConfig& cfg, std::string_view text, const std::string& source) {
  cfg.maxOutputBytes = static_cast<std::size_t>(parseCount(text, source, false));
}

void SetMemoryLimit(EngineConfig& cfg, std::string_view text, const std::string& source) {
  constexpr std::uint64_t kMaxMb = std::numeric_limits<std::uint64_t>::max() / (1024ULL * 1024ULL);
  const std::uint64_t mb = parseCount(text, source, true);
  if (mb > kMaxMb) { invalid(source, "value out of range"); }
  cfg.memoryLimitMb = mb;
}

void SetInterpreter(EngineConfig& cfg, std::string_view text, const std::string& source) {
  if (text.empty()) { invalid(source, "interpreter must not be empty"); }
  cfg.interpreter = std::string(text);
}

void SetTempDir(EngineConfig& cfg, std::string_view text, const std::string& source) {
  if (text.empty()) { invalid(source, "directory must not be empty"); }
  cfg.tempDir = std::string(text);
}

} // namespace pyjudge::config
