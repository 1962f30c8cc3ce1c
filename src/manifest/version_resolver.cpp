#include "manifest/version_resolver.hpp"

#include "core/fs_utils.hpp"

#include <cctype>

namespace relpack::manifest {

namespace {

constexpr std::size_t kMaxTagLength = 128;

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool IsVersionKeyLine(std::string_view line) {
  const std::size_t equals_pos = line.find('=');
  if (equals_pos == std::string_view::npos) {
    return false;
  }
  return Trim(line.substr(0, equals_pos)) == "version";
}

bool IsTagChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' || c == '-';
}

} // namespace

bool IsValidImageTag(std::string_view tag) {
  if (tag.empty() || tag.size() > kMaxTagLength) {
    return false;
  }
  if (tag.front() == '.' || tag.front() == '-') {
    return false;
  }
  for (const char c : tag) {
    if (!IsTagChar(c)) {
      return false;
    }
  }
  return true;
}

bool IsDottedNumericVersion(std::string_view version) {
  const std::size_t dash_pos = version.find('-');
  const std::string_view core = version.substr(0, dash_pos);

  std::size_t components = 0;
  std::size_t digits_in_component = 0;
  for (const char c : core) {
    if (c == '.') {
      if (digits_in_component == 0U) {
        return false;
      }
      ++components;
      digits_in_component = 0;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    ++digits_in_component;
  }
  if (digits_in_component == 0U) {
    return false;
  }
  ++components;
  if (components < 2U) {
    return false;
  }

  if (dash_pos == std::string_view::npos) {
    return true;
  }
  const std::string_view suffix = version.substr(dash_pos + 1);
  if (suffix.empty()) {
    return false;
  }
  for (const char c : suffix) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '.' && c != '-') {
      return false;
    }
  }
  return true;
}

bool ResolveVersionFromText(std::string_view manifest_text, const VersionResolveOptions& options,
                            ResolvedVersion& resolved, std::string& error) {
  resolved = ResolvedVersion{};
  if (options.scan_lines == 0U) {
    error = "version scan window must cover at least 1 line";
    return false;
  }

  std::size_t line_start = 0;
  for (std::size_t line_number = 1; line_number <= options.scan_lines; ++line_number) {
    if (line_start > manifest_text.size()) {
      break;
    }
    const std::size_t line_end = manifest_text.find('\n', line_start);
    std::string_view line = manifest_text.substr(
        line_start, line_end == std::string_view::npos ? std::string_view::npos
                                                       : line_end - line_start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (IsVersionKeyLine(line)) {
      const std::size_t open_quote = line.find('"');
      const std::size_t close_quote =
          open_quote == std::string_view::npos ? std::string_view::npos
                                               : line.find('"', open_quote + 1);
      if (close_quote == std::string_view::npos) {
        error = "version on line " + std::to_string(line_number) + " is not a quoted string";
        return false;
      }

      const std::string_view value = line.substr(open_quote + 1, close_quote - open_quote - 1);
      if (value.empty()) {
        error = "version on line " + std::to_string(line_number) + " is empty";
        return false;
      }
      if (options.strict && !IsDottedNumericVersion(value)) {
        error = "version '" + std::string(value) + "' is not dotted-numeric";
        return false;
      }
      if (!IsValidImageTag(value)) {
        error = "version '" + std::string(value) + "' cannot be used as an image tag";
        return false;
      }

      resolved.version = std::string(value);
      resolved.line_number = line_number;
      return true;
    }

    if (line_end == std::string_view::npos) {
      break;
    }
    line_start = line_end + 1;
  }

  error = "no quoted version found within the first " + std::to_string(options.scan_lines) +
          " lines";
  return false;
}

bool ResolveVersionFromFile(const std::filesystem::path& manifest_path,
                            const VersionResolveOptions& options, ResolvedVersion& resolved,
                            std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(manifest_path, contents, error)) {
    error = "manifest unavailable: " + error;
    return false;
  }
  if (!ResolveVersionFromText(contents, options, resolved, error)) {
    error = manifest_path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace relpack::manifest
