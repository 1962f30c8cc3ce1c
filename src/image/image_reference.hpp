#pragma once

#include <string>
#include <string_view>

namespace relpack::image {

// Split form of `[registry[:port]/]repository[:tag][@digest]`.
struct ImageReference {
  std::string repository;
  std::string tag;
  std::string digest;
};

// Splits `text` into repository/tag/digest. The tag separator is the last
// ':' after the last '/', so `host:5000/app` has no tag.
bool ParseImageReference(std::string_view text, ImageReference& reference, std::string& error);

// True for references that cannot drift: an explicit tag other than
// `latest`, or a content digest.
bool IsPinnedImageReference(std::string_view text);

// Lowercase path components of `[a-z0-9._-]`, optionally prefixed by a
// registry host (which may carry a port).
bool IsValidRepositoryName(std::string_view repository);

// `<repository>:<tag>`.
std::string TaggedReference(std::string_view repository, std::string_view tag);

} // namespace relpack::image
