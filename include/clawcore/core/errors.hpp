#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace clawcore {

// Failure of a provider adapter to obtain any completion.
// The only error class that is fatal to a turn.
class ProviderError : public std::runtime_error {
 public:
  enum class Kind { Auth, RateLimit, BadRequest, Timeout, Network, Server, Parse };

  ProviderError(Kind kind, const std::string &provider, const std::string &message, int status = 0)
      : std::runtime_error("[" + provider + "] " + message), kind_(kind), provider_(provider), status_(status) {}

  Kind kind() const {
    return kind_;
  }

  const std::string &provider() const {
    return provider_;
  }

  // HTTP status, 0 when the request never got a response
  int status() const {
    return status_;
  }

  // Classify an HTTP status code into a failure kind
  static Kind kind_for_status(int status);

 private:
  Kind kind_;
  std::string provider_;
  int status_;
};

std::string to_string(ProviderError::Kind kind);

// Failures local to a single tool or skill invocation. These are reported
// back to the model as a failed tool outcome and never abort the loop.
enum class ToolErrorKind {
  AuthorizationDenied,
  SkillNotFound,
  SkillUnavailable,
  SandboxTimeout,
  SandboxSpawnFailure,
  PathValidation,
  InvalidArguments,
  ExecutionFailed,
  Cancelled
};

std::string to_string(ToolErrorKind kind);

}  // namespace clawcore
