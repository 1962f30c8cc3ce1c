#include "image/image_reference.hpp"

#include "manifest/version_resolver.hpp"

#include <cctype>

namespace relpack::image {

namespace {

bool IsRepositoryComponentChar(char c) {
  return (c >= 'a' && c <= 'z') || std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.' ||
         c == '_' || c == '-';
}

bool IsValidHostComponent(std::string_view host) {
  if (host.empty()) {
    return false;
  }
  for (const char c : host) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '.' && c != '-' && c != ':') {
      return false;
    }
  }
  return true;
}

bool IsValidPathComponent(std::string_view component) {
  if (component.empty()) {
    return false;
  }
  if (!std::isalnum(static_cast<unsigned char>(component.front()))) {
    return false;
  }
  for (const char c : component) {
    if (!IsRepositoryComponentChar(c)) {
      return false;
    }
  }
  return true;
}

bool LooksLikeRegistryHost(std::string_view component) {
  return component.find('.') != std::string_view::npos ||
         component.find(':') != std::string_view::npos || component == "localhost";
}

} // namespace

bool ParseImageReference(std::string_view text, ImageReference& reference, std::string& error) {
  reference = ImageReference{};
  if (text.empty()) {
    error = "image reference cannot be empty";
    return false;
  }

  const std::size_t at_pos = text.find('@');
  if (at_pos != std::string_view::npos) {
    reference.digest = std::string(text.substr(at_pos + 1));
    text = text.substr(0, at_pos);
    if (reference.digest.find(':') == std::string::npos) {
      error = "image digest must be '<algorithm>:<hex>'";
      return false;
    }
  }

  const std::size_t last_slash = text.rfind('/');
  const std::size_t last_colon = text.rfind(':');
  if (last_colon != std::string_view::npos &&
      (last_slash == std::string_view::npos || last_colon > last_slash)) {
    reference.tag = std::string(text.substr(last_colon + 1));
    text = text.substr(0, last_colon);
    if (!manifest::IsValidImageTag(reference.tag)) {
      error = "invalid image tag '" + reference.tag + "'";
      return false;
    }
  }

  reference.repository = std::string(text);
  if (!IsValidRepositoryName(reference.repository)) {
    error = "invalid image repository '" + reference.repository + "'";
    return false;
  }
  return true;
}

bool IsPinnedImageReference(std::string_view text) {
  ImageReference reference;
  std::string error;
  if (!ParseImageReference(text, reference, error)) {
    return false;
  }
  if (!reference.digest.empty()) {
    return true;
  }
  return !reference.tag.empty() && reference.tag != "latest";
}

bool IsValidRepositoryName(std::string_view repository) {
  if (repository.empty()) {
    return false;
  }

  bool first = true;
  std::size_t start = 0;
  while (start <= repository.size()) {
    const std::size_t slash = repository.find('/', start);
    const std::string_view component = repository.substr(
        start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
    const bool has_more = slash != std::string_view::npos;

    if (first && has_more && LooksLikeRegistryHost(component)) {
      if (!IsValidHostComponent(component)) {
        return false;
      }
    } else if (!IsValidPathComponent(component)) {
      return false;
    }

    if (!has_more) {
      return true;
    }
    first = false;
    start = slash + 1;
  }
  return false;
}

std::string TaggedReference(std::string_view repository, std::string_view tag) {
  return std::string(repository) + ":" + std::string(tag);
}

} // namespace relpack::image
