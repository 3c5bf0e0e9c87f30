#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace toolbridge {

using ResourceHandler = std::function<ResourceContent(const std::string& uri)>;

// URI-addressed, read-only resources. Exact URIs win over prefix patterns
// ("scheme://path/*"); URIs compare case-insensitively.
class ResourceRegistry {
 public:
  ResourceRegistry() = default;
  ResourceRegistry(const ResourceRegistry&) = delete;
  ResourceRegistry& operator=(const ResourceRegistry&) = delete;

  void RegisterResource(ResourceInfo info, ResourceHandler handler);
  void RegisterPatternHandler(const std::string& pattern, ResourceHandler handler);
  bool UnregisterResource(const std::string& uri);

  size_t ResourceCount() const;
  std::vector<ResourceInfo> ListResources() const;

  // Unknown URIs yield a text/plain "Resource not found" content; handler
  // exceptions propagate to the caller.
  std::vector<ResourceContent> ReadResource(const std::string& uri);

  uint64_t AccessCount(const std::string& uri) const;

 private:
  struct Registration {
    ResourceInfo info;
    ResourceHandler handler;
    uint64_t access_count = 0;
  };

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<Registration>> resources_;
  // Kept in registration order so the first matching pattern wins.
  std::vector<std::pair<std::string, ResourceHandler>> patterns_;
};

}  // namespace toolbridge
