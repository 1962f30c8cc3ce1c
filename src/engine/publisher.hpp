#pragma once

#include "engine/image_builder.hpp"

#include <string>
#include <vector>

namespace relpack::engine {

struct PublishRequest {
  std::string repository;
  std::vector<PlatformImage> images;
  std::vector<std::string> tags;
};

struct PublishReceipt {
  // Digest every published tag now resolves to.
  std::string digest;
  // `repository:tag` for every tag attached.
  std::vector<std::string> references;
};

// Registry capability injected into the release pipeline.
//
// Contract:
// - All tags in `request.tags` end up pointing at one digest, or none of
//   them is moved.
// - Returns false with `error` set on authentication or transport failure.
class IPublisher {
public:
  virtual ~IPublisher() = default;

  virtual bool Push(const PublishRequest& request, PublishReceipt& receipt,
                    std::string& error) = 0;
};

} // namespace relpack::engine
