#include "clawcore/core/truncate.hpp"

#include "clawcore/core/types.hpp"

namespace clawcore::Truncate {

std::string marker(size_t max_bytes) {
  if (max_bytes >= 1024 && max_bytes % 1024 == 0) {
    return "\n[Output truncated at " + std::to_string(max_bytes / 1024) + "KB]";
  }
  return "\n[Output truncated at " + std::to_string(max_bytes) + " bytes]";
}

size_t utf8_boundary(const std::string &text, size_t max_bytes) {
  if (max_bytes >= text.size()) return text.size();

  // Step back over continuation bytes to the start of the cut sequence
  size_t n = max_bytes;
  while (n > 0 && (static_cast<unsigned char>(text[n]) & 0xC0) == 0x80) {
    --n;
  }
  return n;
}

TruncateResult output(const std::string &text, size_t max_bytes) {
  TruncateResult result;
  std::string safe_text = sanitize_utf8(text);
  std::string tail = marker(max_bytes);

  if (safe_text.size() <= max_bytes) {
    result.content = std::move(safe_text);
    return result;
  }

  // Already truncated at this cap
  if (safe_text.size() >= tail.size() && safe_text.compare(safe_text.size() - tail.size(), tail.size(), tail) == 0 &&
      safe_text.size() - tail.size() <= max_bytes) {
    result.content = std::move(safe_text);
    result.truncated = true;
    return result;
  }

  result.truncated = true;
  result.content = safe_text.substr(0, utf8_boundary(safe_text, max_bytes)) + tail;
  return result;
}

}  // namespace clawcore::Truncate
