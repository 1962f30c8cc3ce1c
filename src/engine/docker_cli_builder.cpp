#include "engine/docker_cli_builder.hpp"

#include "core/fs_utils.hpp"
#include "core/process_utils.hpp"

#include <cctype>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace relpack::engine {

namespace {

std::string TrimWhitespace(std::string text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.pop_back();
  }
  std::size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
    ++start;
  }
  return text.substr(start);
}

} // namespace

DockerCliBuilder::DockerCliBuilder(DockerCliOptions options, core::logging::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

std::string DockerCliBuilder::BuildCommand(const DockerCliOptions& options,
                                           const BuildRequest& request,
                                           const std::string& platform,
                                           const std::string& reference,
                                           const fs::path& iid_path) {
  return core::JoinCommand({
      core::ShellQuote(options.docker_binary),
      "buildx",
      "build",
      "--platform",
      core::ShellQuote(platform),
      "--file",
      core::ShellQuote(request.dockerfile_path.string()),
      "--target",
      core::ShellQuote(request.target_stage),
      "--tag",
      core::ShellQuote(reference),
      "--iidfile",
      core::ShellQuote(iid_path.string()),
      "--load",
      core::ShellQuote(request.context_dir.string()),
  });
}

bool DockerCliBuilder::BuildPlatform(const BuildRequest& request, const std::string& platform,
                                     PlatformImage& image, std::string& error) {
  image = PlatformImage{};
  image.platform = platform;
  image.reference = request.staging_reference + "-" + PlatformSlug(platform);

  if (!core::EnsureDirectory(options_.scratch_dir, error)) {
    return false;
  }
  const fs::path iid_path = options_.scratch_dir / ("iid-" + PlatformSlug(platform) + ".txt");
  std::error_code ec;
  fs::remove(iid_path, ec);

  const std::string command =
      BuildCommand(options_, request, platform, image.reference, iid_path);
  logger_.Debug("invoking container engine", {{"platform", platform}, {"command", command}});

  core::CommandResult result;
  if (!core::RunCommand(command, result, error)) {
    error = "container engine could not be started: " + error;
    return false;
  }
  if (result.exit_code != 0) {
    error = "image build for " + platform + " exited with code " +
            std::to_string(result.exit_code);
    return false;
  }

  std::string iid_text;
  if (!core::ReadTextFile(iid_path, iid_text, error)) {
    error = "image build for " + platform + " produced no image id: " + error;
    return false;
  }
  image.digest = TrimWhitespace(iid_text);
  if (image.digest.empty()) {
    error = "image build for " + platform + " produced an empty image id";
    return false;
  }

  const std::string inspect_command = core::JoinCommand({
      core::ShellQuote(options_.docker_binary),
      "image",
      "inspect",
      "--format",
      core::ShellQuote("{{.Config.User}}"),
      core::ShellQuote(image.reference),
  });
  core::CommandResult inspect;
  if (!core::RunCommandCapture(inspect_command, inspect, error)) {
    return false;
  }
  if (inspect.exit_code != 0) {
    error = "failed to inspect built image " + image.reference;
    return false;
  }
  image.user = TrimWhitespace(inspect.output);
  return true;
}

} // namespace relpack::engine
