#include "config/release_config.hpp"

#include "../common/release_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>

using relpack::config::ConfigReport;
using relpack::config::LoadReleaseConfigText;
using relpack::config::ReleaseConfig;

namespace {

bool HasIssue(const ConfigReport& report, const std::string& path, const std::string& needle) {
  return std::any_of(report.issues.begin(), report.issues.end(), [&](const auto& issue) {
    return issue.path == path && issue.message.find(needle) != std::string::npos;
  });
}

} // namespace

TEST_CASE("Minimal config picks up the packaging defaults", "[config]") {
  ReleaseConfig config;
  ConfigReport report;
  std::string error;
  REQUIRE(LoadReleaseConfigText(R"({"image_name":"example/demo-bot","binary":"demo-bot"})", config,
                                report, error));
  REQUIRE(report.valid);

  REQUIRE(config.builder.image == "rust:1.66.0-bullseye");
  REQUIRE(config.base.image == "debian:bullseye-20211201-slim");
  REQUIRE(config.base.runtime_packages ==
          std::vector<std::string>{"openssl", "ca-certificates", "tzdata"});
  REQUIRE(config.platforms == std::vector<std::string>{"linux/amd64", "linux/arm64"});
  REQUIRE(config.publish_target == "base");
  REQUIRE(config.version_scan_lines == 5U);
  REQUIRE_FALSE(config.strict_version);
  REQUIRE(config.floating_tag == "latest");

  REQUIRE(config.builder.build_command == "cargo build --release --bin demo-bot --features=all");
  REQUIRE(config.builder.artifact_path == "/app/target/release/demo-bot");
  REQUIRE(config.rootless.user == "demo-bot");
  REQUIRE(config.rootless.uid == 1000U);
}

TEST_CASE("Overrides are applied field by field", "[config]") {
  ReleaseConfig config;
  ConfigReport report;
  std::string error;
  REQUIRE(LoadReleaseConfigText(R"({
    "image_name": "ghcr.io/example/demo-bot",
    "binary": "demo-bot",
    "version_scan_lines": 8,
    "strict_version": true,
    "platforms": ["linux/amd64"],
    "publish_target": "base",
    "builder": {"workdir": "/build/", "asset_dirs": []},
    "base": {"runtime_packages": ["ca-certificates"]},
    "rootless": {"user": "bot", "uid": 4242}
  })",
                                config, report, error));
  REQUIRE(report.valid);
  REQUIRE(config.image_name == "ghcr.io/example/demo-bot");
  REQUIRE(config.version_scan_lines == 8U);
  REQUIRE(config.strict_version);
  REQUIRE(config.platforms == std::vector<std::string>{"linux/amd64"});
  REQUIRE(config.publish_target == "base");
  REQUIRE(config.builder.asset_dirs.empty());
  REQUIRE(config.builder.artifact_path == "/build/target/release/demo-bot");
  REQUIRE(config.rootless.user == "bot");
  REQUIRE(config.rootless.uid == 4242U);
}

TEST_CASE("Invalid configs report path-addressed issues", "[config]") {
  ReleaseConfig config;
  ConfigReport report;
  std::string error;
  REQUIRE(LoadReleaseConfigText(R"({
    "image_name": "Example/Demo:1.0",
    "publish_target": "builder",
    "platforms": ["linux/amd64", "linux/amd64", "amd64"],
    "colour": "blue",
    "builder": {"image": "rust:latest", "source_dirs": ["../outside"]},
    "rootless": {"uid": 0}
  })",
                                config, report, error));
  REQUIRE_FALSE(report.valid);

  REQUIRE(HasIssue(report, "binary", "is required"));
  REQUIRE(HasIssue(report, "image_name", "lowercase repository name"));
  REQUIRE(HasIssue(report, "publish_target", "must be 'base'"));
  REQUIRE(HasIssue(report, "platforms[1]", "duplicates an earlier platform"));
  REQUIRE(HasIssue(report, "platforms[2]", "must be 'os/arch'"));
  REQUIRE(HasIssue(report, "colour", "is not a recognized field"));
  REQUIRE(HasIssue(report, "builder.image", "must pin an explicit version tag or digest"));
  REQUIRE(HasIssue(report, "builder.source_dirs[0]", "relative path inside the build context"));
  REQUIRE(HasIssue(report, "rootless.uid", "must be non-zero (uid 0 is root)"));
}

TEST_CASE("Rootless cannot become the configured publish target", "[config]") {
  ReleaseConfig config;
  ConfigReport report;
  std::string error;
  REQUIRE(LoadReleaseConfigText(R"({
    "image_name": "example/demo-bot",
    "binary": "demo-bot",
    "publish_target": "rootless"
  })",
                                config, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "publish_target", "select it per run with --target rootless"));
}

TEST_CASE("Malformed JSON is reported under $", "[config]") {
  ReleaseConfig config;
  ConfigReport report;
  std::string error;
  REQUIRE(LoadReleaseConfigText("{\"image_name\": ", config, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(report.issues.size() == 1U);
  REQUIRE(report.issues.front().path == "$");
  REQUIRE(report.issues.front().message.rfind("parse error at line 1", 0) == 0U);
}

TEST_CASE("Config file resolves the context against its own directory", "[config]") {
  relpack::tests::common::ScopedTempDir temp("relpack-config-test");
  const auto config_path = relpack::tests::common::WriteSampleProject(temp.path());

  const ReleaseConfig config = relpack::tests::common::LoadValidConfigOrFail(config_path);
  REQUIRE(config.context_dir == temp.path().lexically_normal());
  REQUIRE(relpack::config::ManifestPath(config) == config.context_dir / "Cargo.toml");
}

TEST_CASE("Missing and empty config files", "[config]") {
  relpack::tests::common::ScopedTempDir temp("relpack-config-empty");
  ReleaseConfig config;
  ConfigReport report;
  std::string error;

  REQUIRE_FALSE(relpack::config::LoadReleaseConfigFile(temp.path() / "absent.json", config, report,
                                                       error));
  REQUIRE(error.rfind("file not found: ", 0) == 0U);

  relpack::tests::common::WriteFileOrFail(temp.path() / "empty.json", "");
  REQUIRE(relpack::config::LoadReleaseConfigFile(temp.path() / "empty.json", config, report,
                                                 error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(report.issues.front().path == "$");
}
