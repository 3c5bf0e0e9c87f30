#include "resource_registry.hpp"

#include "string_util.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace toolbridge {
namespace {

static bool MatchesPattern(const std::string& uri_lower, const std::string& pattern_lower) {
  if (!pattern_lower.empty() && pattern_lower.back() == '*') {
    const auto prefix = pattern_lower.substr(0, pattern_lower.size() - 1);
    return uri_lower.compare(0, prefix.size(), prefix) == 0;
  }
  return uri_lower == pattern_lower;
}

}  // namespace

void ResourceRegistry::RegisterResource(ResourceInfo info, ResourceHandler handler) {
  if (info.uri.empty() || !handler) return;
  if (!info.mime_type) info.mime_type = "application/json";
  auto reg = std::make_shared<Registration>();
  const auto key = ToLowerAscii(info.uri);
  reg->info = std::move(info);
  reg->handler = std::move(handler);
  std::unique_lock<std::shared_mutex> lock(mu_);
  resources_[key] = std::move(reg);
}

void ResourceRegistry::RegisterPatternHandler(const std::string& pattern, ResourceHandler handler) {
  if (pattern.empty() || !handler) return;
  const auto key = ToLowerAscii(pattern);
  std::unique_lock<std::shared_mutex> lock(mu_);
  for (auto& [p, h] : patterns_) {
    if (p == key) {
      h = std::move(handler);
      return;
    }
  }
  patterns_.emplace_back(key, std::move(handler));
}

bool ResourceRegistry::UnregisterResource(const std::string& uri) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return resources_.erase(ToLowerAscii(uri)) > 0;
}

size_t ResourceRegistry::ResourceCount() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return resources_.size();
}

std::vector<ResourceInfo> ResourceRegistry::ListResources() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ResourceInfo> out;
  out.reserve(resources_.size());
  for (const auto& [_, r] : resources_) out.push_back(r->info);
  std::sort(out.begin(), out.end(), [](const ResourceInfo& a, const ResourceInfo& b) { return a.uri < b.uri; });
  return out;
}

std::vector<ResourceContent> ResourceRegistry::ReadResource(const std::string& uri) {
  const auto key = ToLowerAscii(uri);
  ResourceHandler handler;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = resources_.find(key);
    if (it != resources_.end()) {
      it->second->access_count++;
      handler = it->second->handler;
    } else {
      for (const auto& [pattern, h] : patterns_) {
        if (MatchesPattern(key, pattern)) {
          handler = h;
          break;
        }
      }
    }
  }

  if (!handler) {
    ResourceContent missing;
    missing.uri = uri;
    missing.mime_type = "text/plain";
    missing.text = "Resource not found: " + uri;
    return {missing};
  }

  auto content = handler(uri);
  if (content.uri.empty()) content.uri = uri;
  return {std::move(content)};
}

uint64_t ResourceRegistry::AccessCount(const std::string& uri) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = resources_.find(ToLowerAscii(uri));
  if (it == resources_.end()) return 0;
  return it->second->access_count;
}

}  // namespace toolbridge
