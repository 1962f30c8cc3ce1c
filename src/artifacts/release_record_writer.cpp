#include "artifacts/release_record_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace relpack::artifacts {

std::string ToJson(const ReleaseRecord& record) {
  using core::QuoteJson;

  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\":\"1.0\",\n"
      << "  \"run_id\":" << QuoteJson(record.run_id) << ",\n"
      << "  \"trigger\":{\"kind\":" << QuoteJson(record.trigger)
      << ",\"ref\":" << QuoteJson(record.ref) << "},\n"
      << "  \"image_name\":" << QuoteJson(record.image_name) << ",\n"
      << "  \"version\":" << QuoteJson(record.version) << ",\n"
      << "  \"target_stage\":" << QuoteJson(record.target_stage) << ",\n"
      << "  \"platforms\":" << core::ToJsonStringArray(record.platforms) << ",\n"
      << "  \"build_fingerprint\":" << QuoteJson(record.build_fingerprint) << ",\n"
      << "  \"images\":[";

  for (std::size_t i = 0; i < record.images.size(); ++i) {
    const auto& image = record.images[i];
    out << (i == 0U ? "\n" : ",\n") << "    {\"platform\":" << QuoteJson(image.platform)
        << ",\"reference\":" << QuoteJson(image.reference)
        << ",\"digest\":" << QuoteJson(image.digest)
        << ",\"user\":" << QuoteJson(image.user.empty() ? "root" : image.user) << "}";
  }
  if (!record.images.empty()) {
    out << "\n  ";
  }

  out << "],\n"
      << "  \"published_digest\":" << QuoteJson(record.published_digest) << ",\n"
      << "  \"references\":" << core::ToJsonStringArray(record.references) << ",\n"
      << "  \"state\":" << QuoteJson(record.state) << ",\n"
      << "  \"failure_kind\":" << QuoteJson(record.failure_kind) << ",\n"
      << "  \"error\":" << QuoteJson(record.error) << ",\n"
      << "  \"created_at_utc\":" << QuoteJson(core::FormatUtcTimestamp(record.created_at))
      << ",\n"
      << "  \"finished_at_utc\":" << QuoteJson(core::FormatUtcTimestamp(record.finished_at))
      << "\n"
      << "}\n";
  return out.str();
}

bool WriteReleaseJson(const ReleaseRecord& record, const fs::path& output_dir,
                      fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / "release.json";
  return core::WriteTextFileAtomic(written_path, ToJson(record), error);
}

bool WriteDockerfile(const std::string& dockerfile_text, const fs::path& output_dir,
                     fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / "Dockerfile";
  return core::WriteTextFileAtomic(written_path, dockerfile_text, error);
}

} // namespace relpack::artifacts
