#include "clawcore/core/errors.hpp"

namespace clawcore {

ProviderError::Kind ProviderError::kind_for_status(int status) {
  if (status == 401 || status == 403) return Kind::Auth;
  if (status == 429) return Kind::RateLimit;
  if (status == 408 || status == 504) return Kind::Timeout;
  if (status >= 400 && status < 500) return Kind::BadRequest;
  if (status >= 500) return Kind::Server;
  return Kind::Network;
}

std::string to_string(ProviderError::Kind kind) {
  switch (kind) {
    case ProviderError::Kind::Auth:
      return "auth";
    case ProviderError::Kind::RateLimit:
      return "rate_limit";
    case ProviderError::Kind::BadRequest:
      return "bad_request";
    case ProviderError::Kind::Timeout:
      return "timeout";
    case ProviderError::Kind::Network:
      return "network";
    case ProviderError::Kind::Server:
      return "server";
    case ProviderError::Kind::Parse:
      return "parse";
  }
  return "network";
}

std::string to_string(ToolErrorKind kind) {
  switch (kind) {
    case ToolErrorKind::AuthorizationDenied:
      return "authorization_denied";
    case ToolErrorKind::SkillNotFound:
      return "skill_not_found";
    case ToolErrorKind::SkillUnavailable:
      return "skill_unavailable";
    case ToolErrorKind::SandboxTimeout:
      return "sandbox_timeout";
    case ToolErrorKind::SandboxSpawnFailure:
      return "sandbox_spawn_failure";
    case ToolErrorKind::PathValidation:
      return "path_validation";
    case ToolErrorKind::InvalidArguments:
      return "invalid_arguments";
    case ToolErrorKind::ExecutionFailed:
      return "execution_failed";
    case ToolErrorKind::Cancelled:
      return "cancelled";
  }
  return "execution_failed";
}

}  // namespace clawcore
