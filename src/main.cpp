/***
 * Name: pyjudge::main
 * Purpose: CLI entry point for the pyjudge validation engine.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 passed, 1 failed, 2 usage/config error, 3 host error
 * Theory of Operation:
 *   Parse args then invoke Driver::run. Project exceptions are reported with
 *   a "pyjudge: error: " prefix and exit by blame.
 */
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "driver/Driver.h"
#include "driver/app.h"
#include "pyjudge/exceptions/pyjudge_exception.h"

#include <exception>
#include <iostream>

int main(const int argc, char** argv) {
  using namespace pyjudge;
  try {
    cli::Options opts;
    if (!cli::ParseArgs(argc, argv, opts)) {
      std::cerr << cli::Usage();
      return driver::kExitUsage;
    }
    if (opts.showHelp) {
      std::cout << cli::Usage();
      return driver::kExitOk;
    }
    return driver::Driver::run(opts);
  } catch (const exceptions::PyjudgeException& ex) {
    std::cerr << "pyjudge: error: " << ex.what() << '\n';
    return ex.blame() == exceptions::Blame::Host ? driver::kExitHost : driver::kExitUsage;
  } catch (const std::exception& ex) {
    std::cerr << "pyjudge: internal error: " << ex.what() << '\n';
    return driver::kExitHost;
  }
}
