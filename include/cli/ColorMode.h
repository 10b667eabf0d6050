#pragma once

namespace pyjudge::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace pyjudge::cli
