#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/persistence/file_io.hpp"
#include "internal/persistence/json_codec.hpp"

namespace {

using gallery::config::ConfigLoader;
using gallery::factory::Build;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "gallery_factory_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestPredefinedRequestsSeedTheStore() {
  auto config = ConfigLoader::LoadFromYamlString(R"(challenge:
  predefined_requests:
    - id: r1
      prompt: Draw a heart
)");

  auto app = Build(config);

  const auto& active = app.store->GetActiveRequests();
  assert(active.size() == 1);
  assert(active[0].id() == "r1");
  assert(app.counts->active_request_count() == 1);
  assert(app.counts->artwork_count() == 0);

  assert(app.store->CompleteRequest("r1"));
  assert(app.store->GetActiveRequests().empty());
  assert(app.counts->active_request_count() == 0);
}

void TestWithoutChallengeSectionCountsStayUnset() {
  auto app = Build(gallery::runtime::config::RuntimeConfig{});

  assert(app.store->GetAllRequests().empty());
  assert(!app.counts->active_request_count().has_value());
}

void TestLoadOnStartReplacesPredefinedRequests() {
  const auto dir           = TestDir("load_on_start");
  const auto requests_path = dir / "requests.json";

  gallery::v1::RequestRecord saved;
  saved.set_id("saved");
  saved.set_is_completed(true);
  assert(gallery::persistence::SaveToFile(gallery::persistence::ExportRequests({saved}), requests_path));

  gallery::runtime::config::RuntimeConfig config;
  config.mutable_persistence()->set_requests_path(requests_path.string());
  config.mutable_persistence()->set_load_on_start(true);
  config.mutable_challenge()->add_predefined_requests()->set_id("predefined");

  auto app = Build(config);

  assert(app.store->RequestCount() == 1);
  assert(app.store->GetAllRequests()[0].id() == "saved");
  assert(app.store->GetActiveRequests().empty());
  assert(app.counts->active_request_count() == 0);
}

} // namespace

int main() {
  TestPredefinedRequestsSeedTheStore();
  TestWithoutChallengeSectionCountsStayUnset();
  TestLoadOnStartReplacesPredefinedRequests();

  std::cout << "gallery_unit_factory: pass\n";
  return 0;
}
