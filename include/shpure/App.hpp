#pragma once

#include "shpure/ArgParser.hpp"
#include "shpure/Config.hpp"
#include "shpure/Core.hpp"

namespace shpure::cli {

enum ExitCode : int {
  Success    = 0,
  UsageError = 1, // bad arguments or unparsable input
  IoError    = 2,
};

class App {
  bool verbose_ = false;

public:
  auto run(int argc, char const* const* argv) -> int;
};

} // namespace shpure::cli
