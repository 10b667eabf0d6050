#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ColorMode.h"

namespace pyjudge::cli {

    struct Options {
        bool showHelp{false};
        bool list{false};             // --list
        bool screenOnly{false};       // --screen-only
        bool selfCheck{false};        // --self-check
        bool reportJson{false};       // --report-json[=<file>]
        std::string reportFile{};     // empty: stdout
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool verbose{false};          // --verbose
        std::string challengesPath{}; // --challenges=<file>
        std::string challengeId{};    // --id=<challenge-id>
        std::string showId{};         // --show=<challenge-id>
        // Engine settings stay raw here; config::EngineConfig validates them.
        std::optional<std::string> timeout{};       // --timeout=<s>
        std::optional<std::string> maxConcurrent{}; // --max-concurrent=<n>
        std::optional<std::string> python{};        // --python=<path>
        std::optional<std::string> tmpDir{};        // --tmpdir=<dir>
        std::optional<std::string> memoryMb{};      // --memory-mb=<n>
        std::vector<std::string> inputs{};
        ColorMode color{ColorMode::Auto};
    };

} // namespace pyjudge::cli
