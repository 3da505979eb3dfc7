#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/command_runner.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using gallery::observability::IntField;
using gallery::observability::StringField;

int main(int argc, char** argv) {
  std::vector<std::string> argv_list(argv + 1, argv + argc);

  std::string config_path;
  std::size_t next = 0;
  if (argv_list.size() >= 3 && argv_list[0] == "--config") {
    config_path = argv_list[1];
    next        = 2;
  } else if (argv_list.size() >= 2 && argv_list[0] != "--config") {
    config_path = argv_list[0];
    next        = 1;
  } else {
    gallery::cli::PrintUsage(std::cerr);
    return gallery::cli::kExitUsage;
  }

  const std::string              command = argv_list[next];
  const std::vector<std::string> args(argv_list.begin() + static_cast<std::ptrdiff_t>(next) + 1, argv_list.end());

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = gallery::config::ConfigLoader::LoadFromYaml(config_path);

    gallery::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build store and run the command
    // ------------------------------------------------------------
    auto app = gallery::factory::Build(config);

    std::int64_t notifications = 0;
    app.store->Subscribe([&notifications]() { ++notifications; });

    auto result = gallery::cli::RunCommand(app, command, args, std::cout, std::cerr);

    if (result.mutated && !app.snapshots->Save()) {
      result.status = gallery::cli::kExitSaveFailed;
    }

    GALLERY_LOG_INFO("Command finished",
                     {StringField("command", command), IntField("status", result.status), IntField("changes", notifications),
                      IntField("artworks", app.counts->artwork_count().value_or(static_cast<std::int64_t>(app.store->ArtworkCount()))),
                      IntField("active_requests", app.counts->active_request_count().value_or(0))});

    gallery::observability::ShutdownLogging();
    return result.status;
  } catch (const std::exception& e) {
    GALLERY_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    gallery::observability::ShutdownLogging();
    return gallery::cli::kExitFatal;
  }
}
