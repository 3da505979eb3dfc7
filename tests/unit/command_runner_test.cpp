#include "internal/cli/command_runner.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/persistence/file_io.hpp"
#include "internal/persistence/json_codec.hpp"

namespace {

using gallery::cli::kExitNotFound;
using gallery::cli::kExitOk;
using gallery::cli::kExitUsage;
using gallery::cli::RunCommand;
using gallery::persistence::ExportArtworks;
using gallery::persistence::ExportRequests;
using gallery::persistence::LoadFromFile;
using gallery::persistence::SaveToFile;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "gallery_command_runner_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

gallery::v1::ArtworkRecord MakeArtwork(const std::string& id) {
  gallery::v1::ArtworkRecord artwork;
  artwork.set_id(id);
  artwork.set_name("Artwork " + id);
  artwork.set_width(8);
  artwork.set_height(8);
  return artwork;
}

gallery::v1::RequestRecord MakeRequest(const std::string& id) {
  gallery::v1::RequestRecord request;
  request.set_id(id);
  request.set_prompt("Draw " + id);
  return request;
}

gallery::factory::RuntimeDependencies BuildApp(const std::filesystem::path& dir) {
  gallery::runtime::config::RuntimeConfig config;
  config.mutable_persistence()->set_artworks_path((dir / "artworks.json").string());
  config.mutable_persistence()->set_requests_path((dir / "requests.json").string());
  return gallery::factory::Build(config);
}

struct Run {
  gallery::cli::CommandResult result;
  std::string                 out;
  std::string                 err;
};

Run Execute(gallery::factory::RuntimeDependencies& app, const std::string& command, const std::vector<std::string>& args) {
  std::ostringstream out;
  std::ostringstream err;
  auto               result = RunCommand(app, command, args, out, err);
  return Run{result, out.str(), err.str()};
}

void TestImportArtworksReplacesStore() {
  const auto dir  = TestDir("import_artworks");
  const auto file = dir / "incoming.json";
  assert(SaveToFile(ExportArtworks({MakeArtwork("a"), MakeArtwork("b")}), file));

  auto app = BuildApp(dir);
  app.store->AddArtwork(MakeArtwork("old"));

  const auto run = Execute(app, "import-artworks", {file.string()});
  assert(run.result.status == kExitOk);
  assert(run.result.mutated);
  assert(app.store->ArtworkCount() == 2);
  assert(!app.store->GetArtwork("old").has_value());
}

void TestImportMalformedArtworksKeepsStoreAndSnapshot() {
  const auto dir  = TestDir("import_malformed_artworks");
  const auto file = dir / "bad.json";
  assert(SaveToFile("not json", file));

  auto app = BuildApp(dir);
  app.store->AddArtwork(MakeArtwork("a"));
  app.store->AddArtwork(MakeArtwork("b"));
  assert(app.snapshots->Save());
  const auto saved = LoadFromFile(dir / "artworks.json");
  assert(saved.has_value());

  int notifications = 0;
  app.store->Subscribe([&notifications]() { ++notifications; });

  const auto run = Execute(app, "import-artworks", {file.string()});
  assert(run.result.status == kExitNotFound);
  assert(!run.result.mutated);
  assert(run.err.find("import failed") != std::string::npos);
  assert(notifications == 0);
  assert(app.store->ArtworkCount() == 2);
  assert(LoadFromFile(dir / "artworks.json") == saved);
}

void TestImportEmptyRequestListKeepsStore() {
  const auto dir  = TestDir("import_empty_requests");
  const auto file = dir / "empty.json";
  assert(SaveToFile(ExportRequests({}), file));

  auto app = BuildApp(dir);
  app.store->SetAllRequests(std::vector<gallery::v1::RequestRecord>{MakeRequest("r1")});

  const auto run = Execute(app, "import-requests", {file.string()});
  assert(run.result.status == kExitNotFound);
  assert(!run.result.mutated);
  assert(app.store->RequestCount() == 1);
  assert(app.counts->active_request_count() == 1);
}

void TestImportUnreadableFileReportsNotFound() {
  const auto dir = TestDir("import_missing");
  auto       app = BuildApp(dir);

  const auto run = Execute(app, "import-requests", {(dir / "nope.json").string()});
  assert(run.result.status == kExitNotFound);
  assert(!run.result.mutated);
}

void TestLikeAndCompleteReportMutation() {
  const auto dir = TestDir("like_complete");
  auto       app = BuildApp(dir);
  app.store->AddArtwork(MakeArtwork("a"));
  app.store->SetAllRequests(std::vector<gallery::v1::RequestRecord>{MakeRequest("r1")});

  auto run = Execute(app, "like", {"a"});
  assert(run.result.status == kExitOk);
  assert(run.result.mutated);
  assert(run.out == "a liked\n");
  assert(app.store->HasLiked("a"));

  run = Execute(app, "complete", {"r1"});
  assert(run.result.status == kExitOk);
  assert(run.result.mutated);
  assert(app.store->GetActiveRequests().empty());
}

void TestUnknownIdsReportNotFound() {
  const auto dir = TestDir("unknown_ids");
  auto       app = BuildApp(dir);

  int notifications = 0;
  app.store->Subscribe([&notifications]() { ++notifications; });

  for (const std::string command : {"like", "remove", "complete"}) {
    const auto run = Execute(app, command, {"missing"});
    assert(run.result.status == kExitNotFound);
    assert(!run.result.mutated);
  }
  assert(notifications == 0);
}

void TestUsageErrors() {
  const auto dir = TestDir("usage");
  auto       app = BuildApp(dir);

  auto run = Execute(app, "like", {});
  assert(run.result.status == kExitUsage);

  run = Execute(app, "frobnicate", {});
  assert(run.result.status == kExitUsage);
  assert(run.err.find("Usage:") != std::string::npos);
}

void TestListingsAndExportDoNotMutate() {
  const auto dir = TestDir("listings");
  auto       app = BuildApp(dir);
  app.store->AddArtwork(MakeArtwork("a"));

  auto run = Execute(app, "list-artworks", {});
  assert(run.result.status == kExitOk);
  assert(!run.result.mutated);
  assert(run.out == "a\tArtwork a\t8x8\n");

  run = Execute(app, "export-artworks", {});
  assert(!run.result.mutated);
  assert(run.out.find("\"artworks\"") != std::string::npos);
}

} // namespace

int main() {
  TestImportArtworksReplacesStore();
  TestImportMalformedArtworksKeepsStoreAndSnapshot();
  TestImportEmptyRequestListKeepsStore();
  TestImportUnreadableFileReportsNotFound();
  TestLikeAndCompleteReportMutation();
  TestUnknownIdsReportNotFound();
  TestUsageErrors();
  TestListingsAndExportDoNotMutate();

  std::cout << "gallery_unit_command_runner: pass\n";
  return 0;
}
