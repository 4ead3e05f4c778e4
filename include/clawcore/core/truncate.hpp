#pragma once

#include <cstddef>
#include <string>

namespace clawcore {

// Output size capping shared by tools and the process sandbox
namespace Truncate {

constexpr size_t kDefaultMaxBytes = 30 * 1024;

struct TruncateResult {
  std::string content;
  bool truncated = false;
};

// "\n[Output truncated at 30KB]"; the size is rendered in KB when it divides evenly
std::string marker(size_t max_bytes = kDefaultMaxBytes);

// Sanitize to UTF-8 and cap at max_bytes, appending the marker once. Text
// already truncated at the same cap is returned unchanged.
TruncateResult output(const std::string &text, size_t max_bytes = kDefaultMaxBytes);

// Largest n <= max_bytes such that text[0, n) does not end inside a UTF-8 sequence
size_t utf8_boundary(const std::string &text, size_t max_bytes);

}  // namespace Truncate

}  // namespace clawcore
