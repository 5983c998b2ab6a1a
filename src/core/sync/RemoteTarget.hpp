#pragma once
#include <optional>
#include <string>

// A "user@host:path" destination.
struct RemoteTarget {
  std::string user;
  std::string host;
  std::string path;

  std::string login() const { return user + "@" + host; }
  std::string spec() const { return login() + ":" + path; }
  RemoteTarget child(const std::string& name) const;

  // nullopt for a local destination. Throws ValidationError when the text
  // looks remote (contains '@') but is not a well-formed specifier.
  static std::optional<RemoteTarget> parse(const std::string& destination);
};
