#include "connection_profile.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"

namespace bolt::profile {

namespace {

std::string Join(const std::vector<std::string>& keys) {
  std::ostringstream out;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << keys[i];
  }
  return out.str();
}

void RequireIdentifier(const std::string& value, const char* name) {
  if (value.empty()) {
    throw util::ConfigValidationError(std::string("connection profile requires a ") + name);
  }
}

} // namespace

std::string_view ToString(ConnectionType type) {
  switch (type) {
    case ConnectionType::kLocal:
      return "local";
    case ConnectionType::kCustom:
      return "custom";
    case ConnectionType::kHostedService:
      return "hostedService";
  }
  return "unknown";
}

std::optional<ConnectionType> ParseConnectionType(std::string_view value) {
  if (value == "local") {
    return ConnectionType::kLocal;
  }
  if (value == "custom") {
    return ConnectionType::kCustom;
  }
  if (value == "hostedService" || value == "btcpayserver") {
    return ConnectionType::kHostedService;
  }
  return std::nullopt;
}

const std::set<std::string>& RequiredSettings(ConnectionType type) {
  static const std::set<std::string> kLocal{"alias", "autopilot"};
  static const std::set<std::string> kCustom{"host", "cert", "macaroon"};
  static const std::set<std::string> kHosted{"host", "macaroon"};

  switch (type) {
    case ConnectionType::kLocal:
      return kLocal;
    case ConnectionType::kCustom:
      return kCustom;
    case ConnectionType::kHostedService:
      return kHosted;
  }
  throw util::ConfigValidationError("unknown connection type");
}

bool ParseBool(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

ConnectionProfile::ConnectionProfile(ConnectionType type, std::string currency, std::string network, std::string wallet, Settings settings)
    : type_(type), currency_(std::move(currency)), network_(std::move(network)), wallet_(std::move(wallet)), settings_(std::move(settings)) {
  RequireIdentifier(currency_, "currency");
  RequireIdentifier(network_, "network");
  RequireIdentifier(wallet_, "wallet identifier");

  const auto& required = RequiredSettings(type_);

  std::vector<std::string> missing;
  for (const auto& key : required) {
    if (settings_.find(key) == settings_.end()) {
      missing.push_back(key);
    }
  }

  std::vector<std::string> extra;
  for (const auto& [key, value] : settings_) {
    if (required.find(key) == required.end()) {
      extra.push_back(key);
    }
  }

  if (!missing.empty() || !extra.empty()) {
    std::string message = "invalid settings for " + std::string(ToString(type_)) + " connection:";
    if (!missing.empty()) {
      message += " missing [" + Join(missing) + "]";
    }
    if (!extra.empty()) {
      message += " unexpected [" + Join(extra) + "]";
    }
    throw util::ConfigValidationError(message, std::move(missing), std::move(extra));
  }
}

ConnectionProfile ConnectionProfile::FromOptions(ConnectionType type, std::string currency, std::string network, std::string wallet,
                                                 const Settings& options) {
  Settings picked;
  for (const auto& key : RequiredSettings(type)) {
    if (auto it = options.find(key); it != options.end()) {
      picked.emplace(key, it->second);
    }
  }
  return ConnectionProfile(type, std::move(currency), std::move(network), std::move(wallet), std::move(picked));
}

const std::string& ConnectionProfile::Setting(const std::string& key) const {
  static const std::string kEmpty;
  auto it = settings_.find(key);
  return it == settings_.end() ? kEmpty : it->second;
}

bool ConnectionProfile::Autopilot() const {
  return ParseBool(Setting("autopilot"));
}

std::filesystem::path ConnectionProfile::WalletDir(const std::filesystem::path& lnd_root) const {
  return lnd_root / currency_ / network_ / wallet_;
}

} // namespace bolt::profile
