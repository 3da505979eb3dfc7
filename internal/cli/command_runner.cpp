#include "command_runner.hpp"

#include <utility>

#include "internal/persistence/file_io.hpp"
#include "internal/persistence/json_codec.hpp"

namespace gallery::cli {

namespace {

void PrintArtwork(std::ostream& out, const gallery::v1::ArtworkRecord& artwork) {
  out << artwork.id() << "\t" << artwork.name() << "\t" << artwork.width() << "x" << artwork.height()
      << (artwork.is_liked() ? "\tliked" : "") << "\n";
}

void PrintRequest(std::ostream& out, const gallery::v1::RequestRecord& request) {
  out << request.id() << "\t" << request.prompt() << "\t" << (request.is_completed() ? "completed" : "active") << "\n";
}

CommandResult Status(int status) {
  return CommandResult{status, false};
}

CommandResult Mutated() {
  return CommandResult{kExitOk, true};
}

} // namespace

void PrintUsage(std::ostream& err) {
  err << "Usage:\n"
      << "  gallery-store <config.yaml> <command> [args]\n"
      << "  gallery-store --config <config.yaml> <command> [args]\n"
      << "\n"
      << "Commands:\n"
      << "  list-artworks\n"
      << "  list-requests\n"
      << "  active\n"
      << "  like <artwork_id>\n"
      << "  remove <artwork_id>\n"
      << "  complete <request_id>\n"
      << "  export-artworks\n"
      << "  export-requests\n"
      << "  import-artworks <file.json>\n"
      << "  import-requests <file.json>\n";
}

CommandResult RunCommand(factory::RuntimeDependencies& app,
                         const std::string&            command,
                         const std::vector<std::string>& args,
                         std::ostream&                 out,
                         std::ostream&                 err) {
  auto& store = *app.store;

  auto require_arg = [&args, &command, &err]() -> const std::string* {
    if (args.size() != 1) {
      err << command << ": expected exactly one argument\n";
      return nullptr;
    }
    return &args.front();
  };

  // ------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------

  if (command == "list-artworks") {
    for (const auto& artwork : store.GetAllArtworks()) PrintArtwork(out, artwork);
    return Status(kExitOk);
  }
  if (command == "list-requests") {
    for (const auto& request : store.GetAllRequests()) PrintRequest(out, request);
    return Status(kExitOk);
  }
  if (command == "active") {
    for (const auto& request : store.GetActiveRequests()) PrintRequest(out, request);
    return Status(kExitOk);
  }
  if (command == "export-artworks") {
    out << persistence::ExportArtworks(store.GetAllArtworks()) << "\n";
    return Status(kExitOk);
  }
  if (command == "export-requests") {
    out << persistence::ExportRequests(store.GetAllRequests()) << "\n";
    return Status(kExitOk);
  }

  // ------------------------------------------------------------
  // Mutations
  // ------------------------------------------------------------

  if (command == "like") {
    const auto* id = require_arg();
    if (!id) return Status(kExitUsage);
    if (!store.GetArtwork(*id).has_value()) {
      err << "artwork not found: " << *id << "\n";
      return Status(kExitNotFound);
    }
    store.ToggleLike(*id);
    out << *id << (store.HasLiked(*id) ? " liked" : " unliked") << "\n";
    return Mutated();
  }
  if (command == "remove") {
    const auto* id = require_arg();
    if (!id) return Status(kExitUsage);
    if (!store.RemoveArtwork(*id)) {
      err << "artwork not found: " << *id << "\n";
      return Status(kExitNotFound);
    }
    return Mutated();
  }
  if (command == "complete") {
    const auto* id = require_arg();
    if (!id) return Status(kExitUsage);
    if (!store.CompleteRequest(*id)) {
      err << "request not found: " << *id << "\n";
      return Status(kExitNotFound);
    }
    return Mutated();
  }
  if (command == "import-artworks" || command == "import-requests") {
    const auto* path = require_arg();
    if (!path) return Status(kExitUsage);
    const auto json = persistence::LoadFromFile(*path);
    if (!json) {
      err << "cannot read " << *path << "\n";
      return Status(kExitNotFound);
    }

    if (command == "import-artworks") {
      auto artworks = persistence::ImportArtworks(json);
      if (artworks.empty()) {
        err << "import failed: no valid artwork data in " << *path << "\n";
        return Status(kExitNotFound);
      }
      store.SetAllArtworks(std::move(artworks));
    } else {
      auto requests = persistence::ImportRequests(json);
      if (requests.empty()) {
        err << "import failed: no valid request data in " << *path << "\n";
        return Status(kExitNotFound);
      }
      store.SetAllRequests(std::move(requests));
    }
    return Mutated();
  }

  err << "unknown command: " << command << "\n";
  PrintUsage(err);
  return Status(kExitUsage);
}

} // namespace gallery::cli
