/**
 * @file
 * @brief Option tables and helpers behind cli::ParseArgs.
 */
#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace pyjudge::cli::detail {

/** Tri-state result for option handlers: not ours, consumed, or a bad value. */
enum class OptResult { NotMatched, Handled, Error };

/** A flag-only option; present means true. */
struct FlagSpec {
    std::string_view spelling;
    bool Options::*field;
};

/** A --name=value option. apply returns false with err set for a bad value. */
struct ValueSpec {
    std::string_view name;
    bool (*apply)(Options &out, std::string_view value, std::string &err);
};

std::span<const FlagSpec> flagOptions();
std::span<const ValueSpec> valueOptions();

/** Match arg against both tables and apply it. */
OptResult applyOption(std::string_view arg, Options &out, std::string &err);

/** Parse `--color=<value>`; nullopt for anything but always|never|auto. */
std::optional<ColorMode> parseColorValue(std::string_view value);

/** Detect unknown option-like arguments; a lone '-' is the stdin input. */
bool isUnknownOptionArg(std::string_view arg);

/** --list, --screen-only and --self-check are mutually exclusive. */
bool hasConflictingModes(const Options &opts);

} // namespace pyjudge::cli::detail
