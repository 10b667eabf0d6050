#pragma once

#include <string>

namespace pyjudge::cli {

    std::string Usage();

} // namespace pyjudge::cli
