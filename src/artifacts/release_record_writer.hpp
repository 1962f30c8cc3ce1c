#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace relpack::artifacts {

struct ReleaseRecordImage {
  std::string platform;
  std::string reference;
  std::string digest;
  std::string user;
};

// Everything needed to explain one release run after the fact.
struct ReleaseRecord {
  std::string run_id;
  std::string trigger;
  std::string ref;
  std::string image_name;
  std::string version;
  std::string target_stage;
  std::vector<std::string> platforms;
  std::string build_fingerprint;
  std::vector<ReleaseRecordImage> images;
  std::string published_digest;
  std::vector<std::string> references;
  std::string state;
  std::string failure_kind;
  std::string error;
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point finished_at{};
};

// Canonical key order; one JSON object.
std::string ToJson(const ReleaseRecord& record);

// Writes `<output_dir>/release.json` atomically.
//
// Contract:
// - Creates `output_dir` if needed.
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteReleaseJson(const ReleaseRecord& record, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

// Writes `<output_dir>/Dockerfile` atomically.
bool WriteDockerfile(const std::string& dockerfile_text, const std::filesystem::path& output_dir,
                     std::filesystem::path& written_path, std::string& error);

} // namespace relpack::artifacts
