#include "cli/ParseArgsInternals.h"

#include <array>
#include <string>

namespace pyjudge::cli::detail {

namespace {
bool setString(std::string& field, std::string_view value) {
    field = std::string(value);
    return true;
}
bool setRaw(std::optional<std::string>& field, std::string_view value) {
    field = std::string(value);
    return true;
}

constexpr std::array<FlagSpec, 9> kFlags{{
    {"-h", &Options::showHelp},
    {"--help", &Options::showHelp},
    {"--list", &Options::list},
    {"--screen-only", &Options::screenOnly},
    {"--self-check", &Options::selfCheck},
    {"--report-json", &Options::reportJson},
    {"--metrics", &Options::metrics},
    {"--metrics-json", &Options::metricsJson},
    {"--verbose", &Options::verbose},
}};

// Engine settings stay raw; config::EngineConfig validates them against the
// environment-derived values.
const std::array<ValueSpec, 10> kValues{{
    {"--challenges", [](Options& o, std::string_view v, std::string&) { return setString(o.challengesPath, v); }},
    {"--id", [](Options& o, std::string_view v, std::string&) { return setString(o.challengeId, v); }},
    {"--show",
     [](Options& o, std::string_view v, std::string& err) {
         if (v.empty()) {
             err = "--show needs a challenge id";
             return false;
         }
         return setString(o.showId, v);
     }},
    {"--report-json",
     [](Options& o, std::string_view v, std::string&) {
         o.reportJson = true;
         return setString(o.reportFile, v);
     }},
    {"--color",
     [](Options& o, std::string_view v, std::string& err) {
         const auto mode = parseColorValue(v);
         if (!mode) {
             err = "invalid --color value '" + std::string(v) + "'";
             return false;
         }
         o.color = *mode;
         return true;
     }},
    {"--timeout", [](Options& o, std::string_view v, std::string&) { return setRaw(o.timeout, v); }},
    {"--max-concurrent", [](Options& o, std::string_view v, std::string&) { return setRaw(o.maxConcurrent, v); }},
    {"--python", [](Options& o, std::string_view v, std::string&) { return setRaw(o.python, v); }},
    {"--tmpdir", [](Options& o, std::string_view v, std::string&) { return setRaw(o.tmpDir, v); }},
    {"--memory-mb", [](Options& o, std::string_view v, std::string&) { return setRaw(o.memoryMb, v); }},
}};
} // namespace

/***
 * Name: pyjudge::cli::detail::flagOptions / valueOptions
 * Purpose: The option tables ParseArgs matches against.
 */
std::span<const FlagSpec> flagOptions() { return kFlags; }
std::span<const ValueSpec> valueOptions() { return kValues; }

} // namespace pyjudge::cli::detail
