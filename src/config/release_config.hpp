#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace relpack::config {

// Toolchain stage that compiles the binary. Lock files are copied before the
// source tree so dependency layers stay cacheable across source edits.
struct BuilderStageConfig {
  std::string image = "rust:1.66.0-bullseye";
  std::string workdir = "/app";
  std::vector<std::string> lock_files = {"Cargo.toml", "Cargo.lock"};
  std::vector<std::string> source_dirs = {"src"};
  std::vector<std::string> asset_dirs = {"imgs"};
  // Empty means `cargo build --release --bin <binary> --features=all`.
  std::string build_command;
  // Empty means `<workdir>/target/release/<binary>`.
  std::string artifact_path;
};

// Slim runtime stage; receives only the compiled binary.
struct BaseStageConfig {
  std::string image = "debian:bullseye-20211201-slim";
  std::vector<std::string> runtime_packages = {"openssl", "ca-certificates", "tzdata"};
  std::string install_dir = "/usr/local/bin";
};

// Non-privileged variant layered on top of base.
struct RootlessStageConfig {
  // Empty means the binary name.
  std::string user;
  std::uint32_t uid = 1000;
};

struct ReleaseConfig {
  std::string image_name;
  std::string binary;
  // Build context root. Relative paths resolve against the config file's
  // directory.
  std::filesystem::path context_dir = ".";
  // Relative to `context_dir`.
  std::string manifest_path = "Cargo.toml";
  std::size_t version_scan_lines = 5;
  bool strict_version = false;
  std::string floating_tag = "latest";
  std::vector<std::string> platforms = {"linux/amd64", "linux/arm64"};
  std::string publish_target = "base";
  BuilderStageConfig builder;
  BaseStageConfig base;
  RootlessStageConfig rootless;
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ConfigIssue> issues;
};

// Parses and validates release config JSON text.
//
// Contract:
// - Returns true when validation completed, even if the config is invalid.
// - Returns false only for internal failures.
// - Populates `report`; `config` is fully populated (defaults applied) only
//   when `report.valid` is true.
// - Parse errors are reported as one issue under path `$`.
bool LoadReleaseConfigText(std::string_view json_text, ReleaseConfig& config,
                           ConfigReport& report, std::string& error);

// Loads `config_path` and resolves `context_dir` against its parent
// directory.
//
// Contract:
// - Returns false if the file cannot be read and sets `error`.
// - Otherwise behaves like LoadReleaseConfigText.
bool LoadReleaseConfigFile(const std::filesystem::path& config_path, ReleaseConfig& config,
                           ConfigReport& report, std::string& error);

// Fills derived defaults (`build_command`, `artifact_path`, rootless user).
void ApplyDerivedDefaults(ReleaseConfig& config);

// Absolute-or-relative path of the manifest inside the build context.
std::filesystem::path ManifestPath(const ReleaseConfig& config);

} // namespace relpack::config
