#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace relpack::manifest {

// Metadata headers (`[package]`, `name`, `version`, ...) sit at the top of
// the manifest, so only a short leading window is scanned.
constexpr std::size_t kDefaultVersionScanLines = 5;

struct VersionResolveOptions {
  std::size_t scan_lines = kDefaultVersionScanLines;
  // When set, the quoted value must also be dotted-numeric
  // (`1.2.3`, optionally `-prerelease`). Off by default: quoted values pass
  // through unchanged. Either way the value must be a legal image tag, so
  // `+build` metadata is always rejected.
  bool strict = false;
};

struct ResolvedVersion {
  std::string version;
  // 1-based line the value was taken from.
  std::size_t line_number = 0;
};

// Extracts the release version from manifest text.
//
// Contract:
// - Looks only at the first `options.scan_lines` lines.
// - Picks the first line whose key (text before `=`, trimmed) is `version`.
// - Returns the text between the first pair of double quotes on that line.
// - Fails when no such line exists in the window, when the line has no
//   closing quote, when the quoted value is empty, when the value cannot be
//   used as a registry tag, or (strict mode) when it is not dotted-numeric.
bool ResolveVersionFromText(std::string_view manifest_text, const VersionResolveOptions& options,
                            ResolvedVersion& resolved, std::string& error);

// Reads `manifest_path` and resolves it with ResolveVersionFromText. A missing
// or unreadable manifest is a resolution failure.
bool ResolveVersionFromFile(const std::filesystem::path& manifest_path,
                            const VersionResolveOptions& options, ResolvedVersion& resolved,
                            std::string& error);

// Registry tag grammar: `[A-Za-z0-9_][A-Za-z0-9_.-]{0,127}`.
bool IsValidImageTag(std::string_view tag);

// `N(.N)+` with an optional `-[0-9A-Za-z.-]+` suffix.
bool IsDottedNumericVersion(std::string_view version);

} // namespace relpack::manifest
