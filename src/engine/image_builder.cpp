#include "engine/image_builder.hpp"

namespace relpack::engine {

std::string PlatformSlug(const std::string& platform) {
  std::string slug = platform;
  for (char& c : slug) {
    if (c == '/') {
      c = '-';
    }
  }
  return slug;
}

} // namespace relpack::engine
