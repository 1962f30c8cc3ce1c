#include "engine/directory_registry.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using relpack::engine::DirectoryRegistry;
using relpack::engine::PublishReceipt;
using relpack::engine::PublishRequest;
using relpack::tests::common::AssertEq;
using relpack::tests::common::Fail;

namespace {

constexpr int kPushesPerWriter = 100;

std::string TagFor(const std::string& writer, int i) {
  return writer + "-" + std::to_string(i);
}

PublishRequest MakeRequest(const std::string& tag) {
  PublishRequest request;
  request.repository = "example/demo-bot";
  request.images = {
      {.platform = "linux/amd64", .reference = "example/demo-bot:staging-" + tag,
       .digest = "sha256:" + tag, .user = ""},
  };
  request.tags = {tag};
  return request;
}

} // namespace

int main() {
  const fs::path root =
      relpack::tests::common::CreateUniqueTempDir("relpack-registry-concurrency-smoke");

  std::mutex mutex;
  std::vector<std::string> failures;
  std::map<std::string, std::string> expected;

  // Each writer owns its registry handle, like two separate release runs
  // pointed at the same --registry-dir.
  auto writer = [&](const std::string& name) {
    DirectoryRegistry registry(root);
    for (int i = 0; i < kPushesPerWriter; ++i) {
      const std::string tag = TagFor(name, i);
      PublishReceipt receipt;
      std::string error;
      const bool ok = registry.Push(MakeRequest(tag), receipt, error);
      std::lock_guard<std::mutex> lock(mutex);
      if (!ok) {
        failures.push_back(tag + ": " + error);
        continue;
      }
      expected[tag] = receipt.digest;
    }
  };

  std::thread first(writer, "a");
  std::thread second(writer, "b");
  first.join();
  second.join();

  if (!failures.empty()) {
    Fail("concurrent push failed: " + failures.front());
  }
  if (expected.size() != static_cast<std::size_t>(2 * kPushesPerWriter)) {
    Fail("expected every push to be accepted");
  }

  DirectoryRegistry reader(root);
  std::map<std::string, std::string> tags;
  std::string error;
  if (!reader.ListTags("example/demo-bot", tags, error)) {
    Fail("ListTags failed: " + error);
  }
  if (tags.size() != expected.size()) {
    Fail("pushed " + std::to_string(expected.size()) + " distinct tags, registry holds " +
         std::to_string(tags.size()));
  }
  for (const auto& [tag, digest] : expected) {
    const auto found = tags.find(tag);
    if (found == tags.end()) {
      Fail("tag lost under concurrent pushes: " + tag);
    }
    AssertEq(found->second, digest, "digest for " + tag);
  }

  relpack::tests::common::RemovePathBestEffort(root);
  std::cout << "directory_registry_concurrency_smoke: ok\n";
  return 0;
}
