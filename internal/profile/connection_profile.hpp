#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace bolt::profile {

enum class ConnectionType : std::uint8_t {
  kLocal         = 1,
  kCustom        = 2,
  kHostedService = 3,
};

std::string_view                ToString(ConnectionType type);
std::optional<ConnectionType>   ParseConnectionType(std::string_view value);
const std::set<std::string>&    RequiredSettings(ConnectionType type);

/*
  Describes how to reach a node for one session.

  The settings key set must be exactly RequiredSettings(type); the
  constructor throws ConfigValidationError naming the missing and extra keys.
  Immutable once built.
*/
class ConnectionProfile {
 public:
  using Settings = std::map<std::string, std::string>;

  ConnectionProfile(ConnectionType type, std::string currency, std::string network, std::string wallet, Settings settings);

  // Keeps only the keys required by `type` from a wider option set.
  static ConnectionProfile FromOptions(ConnectionType type, std::string currency, std::string network, std::string wallet,
                                       const Settings& options);

  ConnectionType     Type() const { return type_; }
  const std::string& Currency() const { return currency_; }
  const std::string& Network() const { return network_; }
  const std::string& Wallet() const { return wallet_; }
  const Settings&    AllSettings() const { return settings_; }

  // Empty string when the key is not part of this profile type.
  const std::string& Setting(const std::string& key) const;

  bool IsLocal() const { return type_ == ConnectionType::kLocal; }
  bool Autopilot() const;

  // <lnd_root>/<currency>/<network>/<wallet>
  std::filesystem::path WalletDir(const std::filesystem::path& lnd_root) const;

 private:
  ConnectionType type_;
  std::string    currency_;
  std::string    network_;
  std::string    wallet_;
  Settings       settings_;
};

bool ParseBool(std::string_view value);

} // namespace bolt::profile
