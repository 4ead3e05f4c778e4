#pragma once

#include <mutex>
#include <random>
#include <string>

namespace clawcore {

// Short random identifiers for synthesized tool call ids and session ids
class UUID {
 public:
  static std::string short_id(size_t length = 8) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static std::mutex mutex;
    static std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::lock_guard lock(mutex);
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      result += charset[dist(gen)];
    }
    return result;
  }

  static std::string with_prefix(const std::string& prefix, size_t length = 12) {
    return prefix + "_" + short_id(length);
  }
};

}  // namespace clawcore
