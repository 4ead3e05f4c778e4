#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clawcore/llm/provider.hpp"

namespace clawcore::llm {

// Provider adapters by name, in registration order. Availability is
// re-evaluated on every query.
class ProviderRegistry {
 public:
  // Overwrites silently on a name collision; the slot keeps its position
  void register_provider(std::shared_ptr<Provider> provider);

  std::shared_ptr<Provider> get(const std::string &name) const;

  bool has(const std::string &name) const;

  bool remove(const std::string &name);

  void clear();

  std::vector<std::string> names() const;

  // First registered provider that is available
  std::shared_ptr<Provider> get_default() const;

  std::vector<std::shared_ptr<Provider>> get_available() const;

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Provider>> providers_;
};

}  // namespace clawcore::llm
