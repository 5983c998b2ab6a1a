#include "RemoteTarget.hpp"
#include "core/Errors.hpp"

RemoteTarget RemoteTarget::child(const std::string& name) const {
  RemoteTarget t = *this;
  if (t.path.empty() || t.path.back() != '/') t.path += '/';
  t.path += name;
  return t;
}

std::optional<RemoteTarget> RemoteTarget::parse(const std::string& destination) {
  const auto at = destination.find('@');
  if (at == std::string::npos) return std::nullopt;

  const auto colon = destination.find(':', at + 1);
  if (colon == std::string::npos) {
    throw ValidationError("malformed remote destination (expected user@host:path): " + destination);
  }

  RemoteTarget t;
  t.user = destination.substr(0, at);
  t.host = destination.substr(at + 1, colon - at - 1);
  t.path = destination.substr(colon + 1);

  if (t.user.empty() || t.user.find(':') != std::string::npos || t.user.find('/') != std::string::npos) {
    throw ValidationError("malformed user in remote destination: " + destination);
  }
  if (t.host.empty() || t.host.find('/') != std::string::npos || t.host.find('@') != std::string::npos) {
    throw ValidationError("malformed host in remote destination: " + destination);
  }
  if (t.path.empty()) {
    throw ValidationError("remote destination has no path: " + destination);
  }
  return t;
}
