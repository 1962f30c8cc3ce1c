#include "relpack/cli/router.hpp"

#include "config/release_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "engine/directory_registry.hpp"
#include "engine/docker_cli_builder.hpp"
#include "engine/docker_cli_publisher.hpp"
#include "image/build_plan.hpp"
#include "image/context_fingerprint.hpp"
#include "image/dockerfile_renderer.hpp"
#include "manifest/version_resolver.hpp"
#include "pipeline/release_pipeline.hpp"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitResolutionFailed =
    core::errors::ToInt(core::errors::ExitCode::kResolutionFailed);
constexpr int kExitBuildFailed = core::errors::ToInt(core::errors::ExitCode::kBuildFailed);
constexpr int kExitPublishFailed = core::errors::ToInt(core::errors::ExitCode::kPublishFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  relpack release <relpack.json> (--tag <ref> | --manual) [--target <base|rootless>] "
         "[--out <dir>] [--registry-dir <dir>] [--strict-version] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  relpack plan <relpack.json> [--target <base|rootless>] [--out <dir>]\n"
      << "  relpack resolve-version [--manifest <path>] [--scan-lines <n>] [--strict-version]\n"
      << "  relpack validate <relpack.json>\n"
      << "  relpack version\n";
}

int ExitCodeFor(pipeline::FailureKind kind) {
  switch (kind) {
  case pipeline::FailureKind::kNone:
    return kExitSuccess;
  case pipeline::FailureKind::kResolution:
    return kExitResolutionFailed;
  case pipeline::FailureKind::kBuild:
    return kExitBuildFailed;
  case pipeline::FailureKind::kPublish:
    return kExitPublishFailed;
  case pipeline::FailureKind::kInternal:
    return kExitFailure;
  }
  return kExitFailure;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

bool ParseTargetStage(std::string_view raw, std::string& target, std::string& error) {
  if (raw != image::kBaseStage && raw != image::kRootlessStage) {
    error = "invalid --target '" + std::string(raw) + "' (expected one of: base, rootless)";
    return false;
  }
  target = std::string(raw);
  return true;
}

// Loads and validates `config_path`. Prints issues itself; `exit_code` is
// set whenever false is returned.
bool LoadConfigOrReport(const std::string& config_path, config::ReleaseConfig& config,
                        int& exit_code) {
  config::ConfigReport report;
  std::string error;
  if (!config::LoadReleaseConfigFile(config_path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    exit_code = kExitFailure;
    return false;
  }
  if (!report.valid) {
    std::cerr << "invalid release config: " << config_path << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    exit_code = kExitConfigInvalid;
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "relpack 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <relpack.json>\n";
    return kExitUsage;
  }

  const std::string config_path(args.front());
  config::ReleaseConfig config;
  int exit_code = kExitSuccess;
  if (!LoadConfigOrReport(config_path, config, exit_code)) {
    return exit_code;
  }

  std::cout << "valid: " << config_path << '\n';
  return kExitSuccess;
}

int CommandResolveVersion(const std::vector<std::string_view>& args) {
  fs::path manifest_path = "Cargo.toml";
  manifest::VersionResolveOptions options;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--strict-version") {
      options.strict = true;
      continue;
    }
    if (token == "--manifest") {
      if (!TakeValue(args, i, token, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      manifest_path = value;
      continue;
    }
    if (token == "--scan-lines") {
      if (!TakeValue(args, i, token, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      std::size_t parsed = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
      if (ec != std::errc{} || ptr != value.data() + value.size() || parsed == 0U) {
        std::cerr << "error: --scan-lines must be a positive integer\n";
        return kExitUsage;
      }
      options.scan_lines = parsed;
      continue;
    }

    std::cerr << "error: unknown option: " << token << '\n';
    return kExitUsage;
  }

  manifest::ResolvedVersion resolved;
  if (!manifest::ResolveVersionFromFile(manifest_path, options, resolved, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitResolutionFailed;
  }

  std::cout << resolved.version << '\n';
  return kExitSuccess;
}

struct PlanOptions {
  std::string config_path;
  std::optional<std::string> target_stage;
  std::optional<fs::path> output_dir;
};

bool ParsePlanOptions(const std::vector<std::string_view>& args, PlanOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--target") {
      std::string target;
      if (!TakeValue(args, i, token, value, error) || !ParseTargetStage(value, target, error)) {
        return false;
      }
      options.target_stage = target;
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.config_path.empty()) {
      error = "plan accepts exactly 1 config path";
      return false;
    }
    options.config_path = std::string(token);
  }

  if (options.config_path.empty()) {
    error = "plan requires exactly 1 argument: <relpack.json>";
    return false;
  }
  return true;
}

// Renders the Dockerfile and fingerprints the context without touching the
// container engine.
int CommandPlan(const std::vector<std::string_view>& args) {
  PlanOptions options;
  std::string error;
  if (!ParsePlanOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::ReleaseConfig config;
  int exit_code = kExitSuccess;
  if (!LoadConfigOrReport(options.config_path, config, exit_code)) {
    return exit_code;
  }

  image::BuildPlan plan = image::MakeReleasePlan(config);
  if (options.target_stage.has_value()) {
    plan.publish_target = *options.target_stage;
  }
  if (!image::ValidateBuildPlan(plan, error)) {
    std::cerr << "error: invalid build plan: " << error << '\n';
    return kExitBuildFailed;
  }

  const std::string dockerfile = image::RenderDockerfile(plan);
  image::BuildFingerprint fingerprint;
  if (!image::ComputeBuildFingerprint(plan, dockerfile, config.context_dir, fingerprint, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitBuildFailed;
  }

  if (!options.output_dir.has_value()) {
    std::cout << dockerfile;
    std::cerr << "fingerprint: " << fingerprint.hash_hex << '\n';
    return kExitSuccess;
  }

  const fs::path dockerfile_path = *options.output_dir / "Dockerfile";
  if (!core::EnsureDirectory(*options.output_dir, error) ||
      !core::WriteTextFileAtomic(dockerfile_path, dockerfile, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "dockerfile: " << dockerfile_path.string() << '\n'
            << "target: " << plan.publish_target << '\n'
            << "fingerprint: " << fingerprint.hash_hex << '\n'
            << "context_files: " << fingerprint.files.size() << '\n';
  return kExitSuccess;
}

struct ReleaseCliOptions {
  std::string config_path;
  std::optional<pipeline::Trigger> trigger;
  std::optional<std::string> target_stage;
  fs::path output_dir = "out";
  std::optional<fs::path> registry_dir;
  bool strict_version = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parse `release` args with an explicit contract:
// - one config path
// - exactly one of `--tag <ref>` / `--manual`
// Any unknown flags or duplicate positional args are treated as usage errors.
bool ParseReleaseOptions(const std::vector<std::string_view>& args, ReleaseCliOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--tag" || token == "--manual") {
      if (options.trigger.has_value()) {
        error = "--tag and --manual are mutually exclusive";
        return false;
      }
      pipeline::Trigger trigger;
      if (token == "--tag") {
        if (!TakeValue(args, i, token, value, error)) {
          return false;
        }
        if (value.empty()) {
          error = "--tag requires a non-empty ref";
          return false;
        }
        trigger.kind = pipeline::TriggerKind::kTagPush;
        trigger.ref = value;
      } else {
        trigger.kind = pipeline::TriggerKind::kManual;
      }
      options.trigger = trigger;
      continue;
    }
    if (token == "--strict-version") {
      options.strict_version = true;
      continue;
    }
    if (token == "--target") {
      std::string target;
      if (!TakeValue(args, i, token, value, error) || !ParseTargetStage(value, target, error)) {
        return false;
      }
      options.target_stage = target;
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--registry-dir") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.registry_dir = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.config_path.empty()) {
      error = "release accepts exactly 1 config path";
      return false;
    }
    options.config_path = std::string(token);
  }

  if (options.config_path.empty()) {
    error = "release requires exactly 1 argument: <relpack.json>";
    return false;
  }
  if (!options.trigger.has_value()) {
    error = "release requires a trigger: --tag <ref> or --manual";
    return false;
  }
  return true;
}

int CommandRelease(const std::vector<std::string_view>& args) {
  ReleaseCliOptions cli_options;
  std::string error;
  if (!ParseReleaseOptions(args, cli_options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(cli_options.log_level);

  pipeline::ReleaseOptions options;
  int exit_code = kExitSuccess;
  if (!LoadConfigOrReport(cli_options.config_path, options.config, exit_code)) {
    return exit_code;
  }
  if (cli_options.strict_version) {
    options.config.strict_version = true;
  }
  options.trigger = *cli_options.trigger;
  options.output_dir = cli_options.output_dir;
  options.target_stage = cli_options.target_stage;
  options.run_id = core::MakeReleaseRunId(std::chrono::system_clock::now());

  engine::DockerCliOptions docker_options;
  docker_options.scratch_dir = options.output_dir / options.run_id;
  engine::DockerCliBuilder builder(docker_options, logger);

  std::unique_ptr<engine::IPublisher> publisher;
  if (cli_options.registry_dir.has_value()) {
    publisher = std::make_unique<engine::DirectoryRegistry>(*cli_options.registry_dir);
  } else {
    engine::RegistryCredentials credentials;
    if (!engine::LoadRegistryCredentialsFromEnv(credentials, error)) {
      // A bad manifest outranks missing credentials: resolve first so the
      // exit code names the earliest failing step.
      manifest::ResolvedVersion resolved;
      std::string resolve_error;
      if (!manifest::ResolveVersionFromFile(
              config::ManifestPath(options.config),
              {.scan_lines = options.config.version_scan_lines,
               .strict = options.config.strict_version},
              resolved, resolve_error)) {
        std::cerr << "error: " << resolve_error << '\n';
        return kExitResolutionFailed;
      }
      std::cerr << "error: " << error << '\n';
      return kExitPublishFailed;
    }
    publisher = std::make_unique<engine::DockerCliPublisher>(docker_options,
                                                             std::move(credentials), logger);
  }

  pipeline::ReleaseOutcome outcome;
  const bool published = pipeline::ExecuteRelease(options, builder, *publisher, logger, outcome);

  if (!outcome.release_json_path.empty()) {
    std::cout << "release record: " << outcome.release_json_path.string() << '\n';
  }
  if (!published) {
    std::cerr << "error: " << ToString(outcome.failure_kind) << ": " << outcome.error << '\n';
    return ExitCodeFor(outcome.failure_kind);
  }

  std::cout << "published: " << options.config.image_name << " " << outcome.version << '\n'
            << "digest: " << outcome.published_digest << '\n';
  for (const auto& reference : outcome.references) {
    std::cout << "  - " << reference << '\n';
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "resolve-version") {
    return CommandResolveVersion(args);
  }

  if (command == "plan") {
    return CommandPlan(args);
  }

  if (command == "release") {
    return CommandRelease(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace relpack::cli
