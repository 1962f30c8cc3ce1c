#include "image/build_plan.hpp"
#include "image/context_fingerprint.hpp"
#include "image/dockerfile_renderer.hpp"

#include "../common/assertions.hpp"
#include "../common/release_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using relpack::tests::common::AssertContains;
using relpack::tests::common::AssertEq;
using relpack::tests::common::Fail;

namespace {

relpack::image::BuildFingerprint FingerprintOrFail(const relpack::config::ReleaseConfig& config,
                                                   const std::string& dockerfile) {
  relpack::image::BuildFingerprint fingerprint;
  std::string error;
  if (!relpack::image::ComputeBuildFingerprint(relpack::image::MakeReleasePlan(config),
                                               dockerfile, config.context_dir, fingerprint,
                                               error)) {
    Fail("ComputeBuildFingerprint failed: " + error);
  }
  return fingerprint;
}

} // namespace

int main() {
  const fs::path root = relpack::tests::common::CreateUniqueTempDir("relpack-fingerprint-smoke");
  const fs::path config_path = relpack::tests::common::WriteSampleProject(root);
  const relpack::config::ReleaseConfig config =
      relpack::tests::common::LoadValidConfigOrFail(config_path);
  const std::string dockerfile =
      relpack::image::RenderDockerfile(relpack::image::MakeReleasePlan(config));

  // Unrelated files in the context root are not build inputs.
  relpack::tests::common::WriteFileOrFail(root / "README.md", "not copied\n");

  const auto first = FingerprintOrFail(config, dockerfile);
  if (first.hash_hex.size() != 16U) {
    Fail("fingerprint should be 16 hex digits");
  }
  if (first.files.size() != 4U) {
    Fail("expected exactly 4 context files, got " + std::to_string(first.files.size()));
  }
  AssertEq(first.files[0].relative_path, "Cargo.lock", "files[0]");
  AssertEq(first.files[1].relative_path, "Cargo.toml", "files[1]");
  AssertEq(first.files[2].relative_path, "imgs/logo.svg", "files[2]");
  AssertEq(first.files[3].relative_path, "src/main.rs", "files[3]");

  const auto second = FingerprintOrFail(config, dockerfile);
  AssertEq(second.hash_hex, first.hash_hex, "unchanged inputs");

  const auto other_dockerfile = FingerprintOrFail(config, dockerfile + "# changed\n");
  if (other_dockerfile.hash_hex == first.hash_hex) {
    Fail("Dockerfile change should change the fingerprint");
  }

  relpack::tests::common::WriteFileOrFail(root / "src" / "main.rs", "fn main() {}\n");
  const auto edited = FingerprintOrFail(config, dockerfile);
  if (edited.hash_hex == first.hash_hex) {
    Fail("source edit should change the fingerprint");
  }

  relpack::tests::common::RemovePathBestEffort(root / "src");
  relpack::image::BuildFingerprint missing;
  std::string error;
  if (relpack::image::ComputeBuildFingerprint(relpack::image::MakeReleasePlan(config), dockerfile,
                                              config.context_dir, missing, error)) {
    Fail("missing source directory should fail");
  }
  AssertContains(error, "build context is missing 'src' (required by stage 'builder')");

  relpack::tests::common::RemovePathBestEffort(root);
  std::cout << "context_fingerprint_smoke: ok\n";
  return 0;
}
