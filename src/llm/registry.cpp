#include "clawcore/llm/registry.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace clawcore::llm {

void ProviderRegistry::register_provider(std::shared_ptr<Provider> provider) {
  if (!provider) return;

  std::lock_guard lock(mutex_);
  auto name = provider->name();
  auto it = std::find_if(providers_.begin(), providers_.end(), [&](const auto& p) { return p->name() == name; });
  if (it != providers_.end()) {
    *it = std::move(provider);
  } else {
    providers_.push_back(std::move(provider));
  }
  spdlog::info("[ProviderRegistry] Registered provider: {}", name);
}

std::shared_ptr<Provider> ProviderRegistry::get(const std::string& name) const {
  std::lock_guard lock(mutex_);
  for (const auto& p : providers_) {
    if (p->name() == name) return p;
  }
  return nullptr;
}

bool ProviderRegistry::has(const std::string& name) const {
  return get(name) != nullptr;
}

bool ProviderRegistry::remove(const std::string& name) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(providers_.begin(), providers_.end(), [&](const auto& p) { return p->name() == name; });
  if (it == providers_.end()) return false;
  providers_.erase(it);
  return true;
}

void ProviderRegistry::clear() {
  std::lock_guard lock(mutex_);
  providers_.clear();
}

std::vector<std::string> ProviderRegistry::names() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> result;
  result.reserve(providers_.size());
  for (const auto& p : providers_) {
    result.push_back(p->name());
  }
  return result;
}

std::shared_ptr<Provider> ProviderRegistry::get_default() const {
  std::lock_guard lock(mutex_);
  for (const auto& p : providers_) {
    if (p->is_available()) return p;
  }
  return nullptr;
}

std::vector<std::shared_ptr<Provider>> ProviderRegistry::get_available() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Provider>> result;
  for (const auto& p : providers_) {
    if (p->is_available()) result.push_back(p);
  }
  return result;
}

size_t ProviderRegistry::size() const {
  std::lock_guard lock(mutex_);
  return providers_.size();
}

}  // namespace clawcore::llm
