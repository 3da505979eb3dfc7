#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "internal/factory.hpp"

namespace gallery::cli {

inline constexpr int kExitOk         = 0;
inline constexpr int kExitUsage      = 1;
inline constexpr int kExitFatal      = 2;
inline constexpr int kExitNotFound   = 3;
inline constexpr int kExitSaveFailed = 4;

struct CommandResult {
  int  status  = kExitOk;
  bool mutated = false;
};

void PrintUsage(std::ostream& err);

/*
  RunCommand

  Runs one gallery-store subcommand against an already built store.
  Listings and exports go to out, diagnostics to err. The caller
  saves a snapshot when the result reports a mutation.

  An import whose file yields no records leaves the store untouched
  and reports kExitNotFound, so a corrupt file never replaces saved
  data.
*/
CommandResult RunCommand(factory::RuntimeDependencies& app,
                         const std::string&            command,
                         const std::vector<std::string>& args,
                         std::ostream&                 out,
                         std::ostream&                 err);

} // namespace gallery::cli
