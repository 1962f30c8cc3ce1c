#include "engine/docker_cli_publisher.hpp"

#include "core/process_utils.hpp"
#include "image/image_reference.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace relpack::engine {

namespace {

std::string ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  return value == nullptr ? std::string() : std::string(value);
}

std::string TrimTrailingWhitespace(std::string text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.pop_back();
  }
  return text;
}

} // namespace

bool LoadRegistryCredentialsFromEnv(RegistryCredentials& credentials, std::string& error) {
  credentials.username = ReadEnv("RELPACK_REGISTRY_USERNAME");
  credentials.token = ReadEnv("RELPACK_REGISTRY_TOKEN");
  credentials.registry_host = ReadEnv("RELPACK_REGISTRY_HOST");
  if (credentials.username.empty() || credentials.token.empty()) {
    error = "registry credentials missing: set RELPACK_REGISTRY_USERNAME and "
            "RELPACK_REGISTRY_TOKEN";
    return false;
  }
  return true;
}

DockerCliPublisher::DockerCliPublisher(DockerCliOptions options, RegistryCredentials credentials,
                                       core::logging::Logger& logger)
    : options_(std::move(options)), credentials_(std::move(credentials)), logger_(logger) {}

std::string DockerCliPublisher::LoginCommand(const DockerCliOptions& options,
                                             const RegistryCredentials& credentials) {
  std::vector<std::string> args = {core::ShellQuote(options.docker_binary), "login"};
  if (!credentials.registry_host.empty()) {
    args.push_back(core::ShellQuote(credentials.registry_host));
  }
  args.push_back("--username");
  args.push_back(core::ShellQuote(credentials.username));
  args.push_back("--password-stdin");
  return core::JoinCommand(args);
}

bool DockerCliPublisher::ParsePushedDigest(std::string_view push_output, std::string& digest) {
  // `docker push` ends with `<tag>: digest: sha256:<hex> size: <n>`.
  constexpr std::string_view kMarker = "digest: ";
  const std::size_t marker = push_output.rfind(kMarker);
  if (marker == std::string_view::npos) {
    return false;
  }
  const std::size_t start = marker + kMarker.size();
  std::size_t end = start;
  while (end < push_output.size() &&
         std::isspace(static_cast<unsigned char>(push_output[end])) == 0) {
    ++end;
  }
  const std::string_view value = push_output.substr(start, end - start);
  if (value.rfind("sha256:", 0) != 0 || value.size() == std::string_view("sha256:").size()) {
    return false;
  }
  digest = std::string(value);
  return true;
}

bool DockerCliPublisher::PinnedReference(const std::string& reference, const std::string& digest,
                                         std::string& pinned, std::string& error) {
  image::ImageReference parsed;
  if (!image::ParseImageReference(reference, parsed, error)) {
    return false;
  }
  pinned = parsed.repository + "@" + digest;
  return true;
}

std::string DockerCliPublisher::CreateIndexCommand(const DockerCliOptions& options,
                                                   const PublishRequest& request,
                                                   const std::vector<std::string>& sources) {
  std::vector<std::string> args = {core::ShellQuote(options.docker_binary), "buildx",
                                   "imagetools", "create"};
  for (const auto& tag : request.tags) {
    args.push_back("--tag");
    args.push_back(core::ShellQuote(image::TaggedReference(request.repository, tag)));
  }
  for (const auto& source : sources) {
    args.push_back(core::ShellQuote(source));
  }
  return core::JoinCommand(args);
}

bool DockerCliPublisher::RunChecked(const std::string& command, std::string_view what,
                                    std::string& error) {
  logger_.Debug("invoking container engine", {{"step", what}, {"command", command}});
  core::CommandResult result;
  if (!core::RunCommand(command, result, error)) {
    error = std::string(what) + " could not be started: " + error;
    return false;
  }
  if (result.exit_code != 0) {
    error = std::string(what) + " exited with code " + std::to_string(result.exit_code);
    return false;
  }
  return true;
}

bool DockerCliPublisher::Push(const PublishRequest& request, PublishReceipt& receipt,
                              std::string& error) {
  receipt = PublishReceipt{};
  if (request.images.empty() || request.tags.empty()) {
    error = "publish request needs at least one image and one tag";
    return false;
  }
  if (credentials_.username.empty() || credentials_.token.empty()) {
    error = "registry credentials missing";
    return false;
  }

  core::CommandResult login;
  if (!core::RunCommandWithInput(LoginCommand(options_, credentials_), credentials_.token, login,
                                 error)) {
    error = "registry login could not be started: " + error;
    return false;
  }
  if (login.exit_code != 0) {
    error = "registry login failed (exit code " + std::to_string(login.exit_code) + ")";
    return false;
  }

  // The index is assembled from `repo@digest` as reported by each push, so a
  // staging tag moved by another runner cannot leak into this release.
  std::vector<std::string> sources;
  for (const auto& platform_image : request.images) {
    const std::string push_command = core::JoinCommand({
        core::ShellQuote(options_.docker_binary),
        "push",
        core::ShellQuote(platform_image.reference),
    });
    logger_.Debug("invoking container engine",
                  {{"step", "push of " + platform_image.platform}, {"command", push_command}});
    core::CommandResult pushed;
    if (!core::RunCommandCapture(push_command, pushed, error)) {
      error = "push of " + platform_image.platform + " could not be started: " + error;
      return false;
    }
    if (pushed.exit_code != 0) {
      error = "push of " + platform_image.platform + " exited with code " +
              std::to_string(pushed.exit_code);
      return false;
    }

    std::string pushed_digest;
    if (!ParsePushedDigest(pushed.output, pushed_digest)) {
      error = "push of " + platform_image.platform + " reported no manifest digest";
      return false;
    }
    std::string pinned;
    if (!PinnedReference(platform_image.reference, pushed_digest, pinned, error)) {
      return false;
    }
    sources.push_back(pinned);
  }

  // Release tags are only touched here.
  if (!RunChecked(CreateIndexCommand(options_, request, sources), "tagging multi-arch index",
                  error)) {
    return false;
  }

  const std::string inspect_command = core::JoinCommand({
      core::ShellQuote(options_.docker_binary),
      "buildx",
      "imagetools",
      "inspect",
      "--format",
      core::ShellQuote("{{.Manifest.Digest}}"),
      core::ShellQuote(image::TaggedReference(request.repository, request.tags.front())),
  });
  core::CommandResult inspect;
  if (!core::RunCommandCapture(inspect_command, inspect, error)) {
    return false;
  }
  if (inspect.exit_code != 0) {
    error = "failed to read back published digest (exit code " +
            std::to_string(inspect.exit_code) + ")";
    return false;
  }

  receipt.digest = TrimTrailingWhitespace(inspect.output);
  for (const auto& tag : request.tags) {
    receipt.references.push_back(image::TaggedReference(request.repository, tag));
  }
  logger_.Info("published image", {{"repository", request.repository},
                                   {"digest", receipt.digest}});
  return true;
}

} // namespace relpack::engine
