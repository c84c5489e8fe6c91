#include "profile_store.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bolt::profile {

using bolt::observability::StringField;

namespace {

// Write to a sibling temp file, then rename over the target.
void WriteDocument(const std::filesystem::path& path, const YAML::Emitter& emitter) {
  if (!emitter.good()) {
    throw std::runtime_error("failed to encode " + path.string() + ": " + emitter.GetLastError());
  }

  std::filesystem::create_directories(path.parent_path());

  auto tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open " + tmp_path.string() + " for writing");
    }
    out << emitter.c_str() << '\n';
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    throw std::runtime_error("failed to replace " + path.string() + ": " + ec.message());
  }
}

std::optional<YAML::Node> ReadDocument(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }
  try {
    return YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw util::ConfigValidationError("failed to parse " + path.string() + ": " + e.what());
  }
}

std::string RequireScalar(const YAML::Node& node, const char* key, const std::filesystem::path& path) {
  const auto value = node[key];
  if (!value || !value.IsScalar()) {
    throw util::ConfigValidationError(path.string() + ": missing '" + key + "'");
  }
  return value.as<std::string>();
}

ConnectionType RequireType(const YAML::Node& node, const std::filesystem::path& path) {
  const auto raw  = RequireScalar(node, "type", path);
  const auto type = ParseConnectionType(raw);
  if (!type.has_value()) {
    throw util::ConfigValidationError(path.string() + ": unknown connection type '" + raw + "'");
  }
  return *type;
}

} // namespace

ProfileStore::ProfileStore(std::filesystem::path root) : root_(std::move(root)) {
}

std::filesystem::path ProfileStore::SettingsPath() const {
  return root_ / "settings.yaml";
}

std::filesystem::path ProfileStore::ProfilePath(const std::string& currency, const std::string& network, const std::string& wallet) const {
  return root_ / "lnd" / currency / network / wallet / "config.yaml";
}

std::optional<ActiveConnection> ProfileStore::LoadActiveConnection() const {
  const auto path     = SettingsPath();
  const auto document = ReadDocument(path);
  if (!document.has_value()) {
    return std::nullopt;
  }

  const auto node = (*document)["activeConnection"];
  if (!node || !node.IsMap()) {
    return std::nullopt;
  }

  ActiveConnection active;
  active.type     = RequireType(node, path);
  active.currency = RequireScalar(node, "currency", path);
  active.network  = RequireScalar(node, "network", path);
  active.wallet   = RequireScalar(node, "wallet", path);
  return active;
}

std::optional<ConnectionProfile> ProfileStore::Load() const {
  const auto active = LoadActiveConnection();
  if (!active.has_value()) {
    return std::nullopt;
  }

  const auto path     = ProfilePath(active->currency, active->network, active->wallet);
  const auto document = ReadDocument(path);
  if (!document.has_value()) {
    BOLT_LOG_WARN("Active connection has no stored profile", {StringField("path", path.string())});
    return std::nullopt;
  }

  const auto& node = *document;

  ConnectionProfile::Settings settings;
  if (const auto stored = node["settings"]; stored && stored.IsMap()) {
    for (const auto& entry : stored) {
      if (!entry.first.IsScalar() || !entry.second.IsScalar()) {
        throw util::ConfigValidationError(path.string() + ": settings must map names to plain values");
      }
      settings[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
  }

  return ConnectionProfile(RequireType(node, path), RequireScalar(node, "currency", path), RequireScalar(node, "network", path),
                           RequireScalar(node, "wallet", path), std::move(settings));
}

void ProfileStore::Save(const ConnectionProfile& profile) const {
  YAML::Emitter doc;
  doc << YAML::BeginMap;
  doc << YAML::Key << "type" << YAML::Value << std::string(ToString(profile.Type()));
  doc << YAML::Key << "currency" << YAML::Value << profile.Currency();
  doc << YAML::Key << "network" << YAML::Value << profile.Network();
  doc << YAML::Key << "wallet" << YAML::Value << profile.Wallet();
  doc << YAML::Key << "settings" << YAML::Value << YAML::BeginMap;
  for (const auto& [key, value] : profile.AllSettings()) {
    doc << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << value;
  }
  doc << YAML::EndMap;
  doc << YAML::EndMap;

  WriteDocument(ProfilePath(profile.Currency(), profile.Network(), profile.Wallet()), doc);

  YAML::Emitter settings;
  settings << YAML::BeginMap;
  settings << YAML::Key << "activeConnection" << YAML::Value << YAML::BeginMap;
  settings << YAML::Key << "type" << YAML::Value << std::string(ToString(profile.Type()));
  settings << YAML::Key << "currency" << YAML::Value << profile.Currency();
  settings << YAML::Key << "network" << YAML::Value << profile.Network();
  settings << YAML::Key << "wallet" << YAML::Value << profile.Wallet();
  settings << YAML::EndMap;
  settings << YAML::EndMap;

  WriteDocument(SettingsPath(), settings);

  BOLT_LOG_INFO("Saved active connection",
                {StringField("type", ToString(profile.Type())), StringField("currency", profile.Currency()),
                 StringField("network", profile.Network()), StringField("wallet", profile.Wallet())});
}

} // namespace bolt::profile
