#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "connection_profile.hpp"

namespace bolt::profile {

struct ActiveConnection {
  ConnectionType type = ConnectionType::kLocal;
  std::string    currency;
  std::string    network;
  std::string    wallet;
};

/*
  Persists connection profiles as small YAML documents.

  <root>/settings.yaml                                     activeConnection record
  <root>/lnd/<currency>/<network>/<wallet>/config.yaml     full profile
*/
class ProfileStore {
 public:
  explicit ProfileStore(std::filesystem::path root);

  // nullopt when no active connection (or its profile document) exists.
  // Throws ConfigValidationError when the stored profile is malformed.
  std::optional<ConnectionProfile> Load() const;

  // Writes the profile document and records it as the active connection.
  void Save(const ConnectionProfile& profile) const;

  std::optional<ActiveConnection> LoadActiveConnection() const;

  std::filesystem::path ProfilePath(const std::string& currency, const std::string& network, const std::string& wallet) const;
  std::filesystem::path SettingsPath() const;

 private:
  std::filesystem::path root_;
};

} // namespace bolt::profile
