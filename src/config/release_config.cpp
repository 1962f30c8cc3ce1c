#include "config/release_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "image/image_reference.hpp"
#include "manifest/version_resolver.hpp"

#include <cctype>
#include <cmath>
#include <initializer_list>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace relpack::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::size_t kMaxScanLines = 1000;
constexpr std::uint32_t kMaxUid = 65534;

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void RejectUnknownFields(const JsonValue& object, std::string_view prefix,
                         std::initializer_list<std::string_view> known, ConfigReport& report) {
  for (const auto& [key, value] : object.object_value) {
    bool recognized = false;
    for (const std::string_view candidate : known) {
      if (key == candidate) {
        recognized = true;
        break;
      }
    }
    if (!recognized) {
      AddIssue(report, std::string(prefix) + key, "is not a recognized field");
    }
  }
}

bool IsRelativeContextPath(std::string_view text) {
  if (text.empty() || text.front() == '/') {
    return false;
  }
  for (const auto& part : fs::path(text)) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

bool IsBinaryName(std::string_view name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  for (const char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '.' && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}

bool IsPackageName(std::string_view name) {
  if (name.empty() || std::isalnum(static_cast<unsigned char>(name.front())) == 0) {
    return false;
  }
  for (const char c : name) {
    const bool lower_or_digit = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    if (!lower_or_digit && c != '.' && c != '+' && c != '-') {
      return false;
    }
  }
  return true;
}

bool IsUserName(std::string_view name) {
  if (name.empty() || name.size() > 32U) {
    return false;
  }
  const char first = name.front();
  if (!((first >= 'a' && first <= 'z') || first == '_')) {
    return false;
  }
  for (const char c : name) {
    const bool lower_or_digit = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    if (!lower_or_digit && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}

// `os/arch[/variant]`, lowercase alphanumerics.
bool IsPlatform(std::string_view text) {
  std::size_t components = 0;
  std::size_t start = 0;
  while (true) {
    const std::size_t slash = text.find('/', start);
    const std::string_view part = text.substr(
        start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
    if (part.empty()) {
      return false;
    }
    for (const char c : part) {
      if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_')) {
        return false;
      }
    }
    ++components;
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return components == 2U || components == 3U;
}

bool ReadString(const JsonValue& object, std::string_view key, std::string_view path,
                std::string& out, ConfigReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return false;
  }
  if (!field->IsString()) {
    AddIssue(report, std::string(path), "must be a string");
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadStringArray(const JsonValue& object, std::string_view key, std::string_view path,
                     std::vector<std::string>& out, ConfigReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return false;
  }
  if (!field->IsArray()) {
    AddIssue(report, std::string(path), "must be an array of strings");
    return false;
  }

  std::vector<std::string> values;
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    if (!item.IsString()) {
      AddIssue(report, std::string(path) + "[" + std::to_string(i) + "]", "must be a string");
      return false;
    }
    values.push_back(item.string_value);
  }
  out = std::move(values);
  return true;
}

bool ReadPositiveInteger(const JsonValue& object, std::string_view key, std::string_view path,
                         std::uint64_t max_value, std::uint64_t& out, ConfigReport& report) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return false;
  }
  const double number = field->number_value;
  if (!field->IsNumber() || !std::isfinite(number) || std::floor(number) != number ||
      number < 1.0 || number > static_cast<double>(max_value)) {
    AddIssue(report, std::string(path),
             "must be an integer between 1 and " + std::to_string(max_value));
    return false;
  }
  out = static_cast<std::uint64_t>(number);
  return true;
}

void ValidateContextPaths(const std::vector<std::string>& paths, std::string_view path,
                          ConfigReport& report) {
  for (std::size_t i = 0; i < paths.size(); ++i) {
    if (!IsRelativeContextPath(paths[i])) {
      AddIssue(report, std::string(path) + "[" + std::to_string(i) + "]",
               "must be a relative path inside the build context");
    }
  }
}

void ValidateImage(const std::string& image, std::string_view path, ConfigReport& report) {
  if (!image::IsPinnedImageReference(image)) {
    AddIssue(report, std::string(path),
             "must pin an explicit version tag or digest (floating tags are not reproducible)");
  }
}

void LoadBuilder(const JsonValue& root, BuilderStageConfig& builder, ConfigReport& report) {
  const JsonValue* section = root.Find("builder");
  if (section == nullptr) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, "builder", "must be an object");
    return;
  }
  RejectUnknownFields(*section, "builder.",
                      {"image", "workdir", "lock_files", "source_dirs", "asset_dirs",
                       "build_command", "artifact_path"},
                      report);

  ReadString(*section, "image", "builder.image", builder.image, report);
  ValidateImage(builder.image, "builder.image", report);

  if (ReadString(*section, "workdir", "builder.workdir", builder.workdir, report) &&
      (builder.workdir.empty() || builder.workdir.front() != '/')) {
    AddIssue(report, "builder.workdir", "must be an absolute path");
  }

  if (ReadStringArray(*section, "lock_files", "builder.lock_files", builder.lock_files, report)) {
    ValidateContextPaths(builder.lock_files, "builder.lock_files", report);
  }
  if (ReadStringArray(*section, "source_dirs", "builder.source_dirs", builder.source_dirs,
                      report)) {
    ValidateContextPaths(builder.source_dirs, "builder.source_dirs", report);
    if (builder.source_dirs.empty()) {
      AddIssue(report, "builder.source_dirs", "must list at least one source directory");
    }
  }
  if (ReadStringArray(*section, "asset_dirs", "builder.asset_dirs", builder.asset_dirs,
                      report)) {
    ValidateContextPaths(builder.asset_dirs, "builder.asset_dirs", report);
  }

  if (ReadString(*section, "build_command", "builder.build_command", builder.build_command,
                 report) &&
      builder.build_command.empty()) {
    AddIssue(report, "builder.build_command", "cannot be empty when present");
  }
  if (ReadString(*section, "artifact_path", "builder.artifact_path", builder.artifact_path,
                 report) &&
      (builder.artifact_path.empty() || builder.artifact_path.front() != '/')) {
    AddIssue(report, "builder.artifact_path", "must be an absolute path");
  }
}

void LoadBase(const JsonValue& root, BaseStageConfig& base, ConfigReport& report) {
  const JsonValue* section = root.Find("base");
  if (section == nullptr) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, "base", "must be an object");
    return;
  }
  RejectUnknownFields(*section, "base.", {"image", "runtime_packages", "install_dir"}, report);

  ReadString(*section, "image", "base.image", base.image, report);
  ValidateImage(base.image, "base.image", report);

  if (ReadStringArray(*section, "runtime_packages", "base.runtime_packages",
                      base.runtime_packages, report)) {
    for (std::size_t i = 0; i < base.runtime_packages.size(); ++i) {
      if (!IsPackageName(base.runtime_packages[i])) {
        AddIssue(report, "base.runtime_packages[" + std::to_string(i) + "]",
                 "must be a package name ([a-z0-9.+-])");
      }
    }
  }

  if (ReadString(*section, "install_dir", "base.install_dir", base.install_dir, report) &&
      (base.install_dir.empty() || base.install_dir.front() != '/')) {
    AddIssue(report, "base.install_dir", "must be an absolute path");
  }
}

void LoadRootless(const JsonValue& root, RootlessStageConfig& rootless, ConfigReport& report) {
  const JsonValue* section = root.Find("rootless");
  if (section == nullptr) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, "rootless", "must be an object");
    return;
  }
  RejectUnknownFields(*section, "rootless.", {"user", "uid"}, report);

  if (ReadString(*section, "user", "rootless.user", rootless.user, report) &&
      (!IsUserName(rootless.user) || rootless.user == "root")) {
    AddIssue(report, "rootless.user", "must be a non-root login name ([a-z_][a-z0-9_-]*)");
  }

  const JsonValue* uid = section->Find("uid");
  if (uid != nullptr && uid->IsNumber() && uid->number_value == 0.0) {
    AddIssue(report, "rootless.uid", "must be non-zero (uid 0 is root)");
    return;
  }
  std::uint64_t parsed_uid = 0;
  if (ReadPositiveInteger(*section, "uid", "rootless.uid", kMaxUid, parsed_uid, report)) {
    rootless.uid = static_cast<std::uint32_t>(parsed_uid);
  }
}

void ValidateReleaseObject(const JsonValue& root, ReleaseConfig& config, ConfigReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, "$", "release config must be a JSON object");
    return;
  }

  RejectUnknownFields(root, "",
                      {"image_name", "binary", "context_dir", "manifest_path",
                       "version_scan_lines", "strict_version", "floating_tag", "platforms",
                       "publish_target", "builder", "base", "rootless"},
                      report);

  if (root.Find("image_name") == nullptr) {
    AddIssue(report, "image_name", "is required");
  } else if (ReadString(root, "image_name", "image_name", config.image_name, report) &&
             !image::IsValidRepositoryName(config.image_name)) {
    AddIssue(report, "image_name",
             "must be a lowercase repository name without tag (e.g. org/app)");
  }

  if (root.Find("binary") == nullptr) {
    AddIssue(report, "binary", "is required");
  } else if (ReadString(root, "binary", "binary", config.binary, report) &&
             !IsBinaryName(config.binary)) {
    AddIssue(report, "binary", "must be a plain file name ([A-Za-z0-9._-])");
  }

  std::string context_dir;
  if (ReadString(root, "context_dir", "context_dir", context_dir, report)) {
    if (context_dir.empty()) {
      AddIssue(report, "context_dir", "cannot be empty");
    } else {
      config.context_dir = context_dir;
    }
  }

  if (ReadString(root, "manifest_path", "manifest_path", config.manifest_path, report) &&
      !IsRelativeContextPath(config.manifest_path)) {
    AddIssue(report, "manifest_path", "must be a relative path inside the build context");
  }

  std::uint64_t scan_lines = 0;
  if (ReadPositiveInteger(root, "version_scan_lines", "version_scan_lines", kMaxScanLines,
                          scan_lines, report)) {
    config.version_scan_lines = static_cast<std::size_t>(scan_lines);
  }

  if (const JsonValue* strict = root.Find("strict_version"); strict != nullptr) {
    if (!strict->IsBool()) {
      AddIssue(report, "strict_version", "must be a boolean");
    } else {
      config.strict_version = strict->bool_value;
    }
  }

  if (ReadString(root, "floating_tag", "floating_tag", config.floating_tag, report) &&
      !manifest::IsValidImageTag(config.floating_tag)) {
    AddIssue(report, "floating_tag", "must be a valid image tag");
  }

  if (ReadStringArray(root, "platforms", "platforms", config.platforms, report)) {
    if (config.platforms.empty()) {
      AddIssue(report, "platforms", "must list at least one platform");
    }
    std::set<std::string> seen;
    for (std::size_t i = 0; i < config.platforms.size(); ++i) {
      const std::string item_path = "platforms[" + std::to_string(i) + "]";
      if (!IsPlatform(config.platforms[i])) {
        AddIssue(report, item_path, "must be 'os/arch' or 'os/arch/variant'");
      } else if (!seen.insert(config.platforms[i]).second) {
        AddIssue(report, item_path, "duplicates an earlier platform");
      }
    }
  }

  // Rootless is never the automatic target; it is chosen per run with
  // `--target rootless`.
  if (ReadString(root, "publish_target", "publish_target", config.publish_target, report)) {
    if (config.publish_target == "rootless") {
      AddIssue(report, "publish_target",
               "rootless is never auto-published; select it per run with --target rootless");
    } else if (config.publish_target != "base") {
      AddIssue(report, "publish_target", "must be 'base'");
    }
  }

  LoadBuilder(root, config.builder, report);
  LoadBase(root, config.base, report);
  LoadRootless(root, config.rootless, report);
}

} // namespace

void ApplyDerivedDefaults(ReleaseConfig& config) {
  if (config.builder.build_command.empty()) {
    config.builder.build_command =
        "cargo build --release --bin " + config.binary + " --features=all";
  }
  if (config.builder.artifact_path.empty()) {
    std::string workdir = config.builder.workdir;
    if (!workdir.empty() && workdir.back() == '/') {
      workdir.pop_back();
    }
    config.builder.artifact_path = workdir + "/target/release/" + config.binary;
  }
  if (config.rootless.user.empty()) {
    config.rootless.user = config.binary;
  }
}

fs::path ManifestPath(const ReleaseConfig& config) {
  return config.context_dir / config.manifest_path;
}

bool LoadReleaseConfigText(std::string_view json_text, ReleaseConfig& config,
                           ConfigReport& report, std::string& /*error*/) {
  report = ConfigReport{};
  config = ReleaseConfig{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    report.valid = false;
    return true;
  }

  ValidateReleaseObject(root, config, report);
  report.valid = report.issues.empty();
  if (report.valid) {
    ApplyDerivedDefaults(config);
    if (config.rootless.user == "root" || !IsUserName(config.rootless.user)) {
      AddIssue(report, "binary",
               "cannot double as the rootless login name; set rootless.user explicitly");
      report.valid = false;
    }
  }
  return true;
}

bool LoadReleaseConfigFile(const fs::path& config_path, ReleaseConfig& config,
                           ConfigReport& report, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(config_path, contents, error)) {
    return false;
  }

  if (contents.empty()) {
    report = ConfigReport{};
    AddIssue(report, "$", "release config is empty; provide a JSON object");
    report.valid = false;
    return true;
  }

  if (!LoadReleaseConfigText(contents, config, report, error)) {
    return false;
  }
  if (report.valid && config.context_dir.is_relative()) {
    fs::path resolved = (config_path.parent_path() / config.context_dir).lexically_normal();
    // `dir/.` normalizes to `dir/`; keep the trailing-separator-free spelling.
    if (!resolved.has_filename() && resolved.has_parent_path()) {
      resolved = resolved.parent_path();
    }
    config.context_dir = resolved;
  }
  return true;
}

} // namespace relpack::config
