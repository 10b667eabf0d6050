/***
 * Name: pyjudge::analysis::Diagnostic
 * Purpose: Carry a diagnostic message with optional source location.
 */
#pragma once

#include <string>

namespace pyjudge::analysis {
    struct Diagnostic {
        std::string message;
        std::string file;
        int line{0};
        int col{0};
    };
} // namespace pyjudge::analysis
