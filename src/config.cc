#include "config.hh"

#include <cstdlib>
#include <fstream>

#include "util.hh"

namespace punchcard {
Config::Config() { Reload(); }

Config &Config::Get() {
  static Config config;
  return config;
}

std::filesystem::path GetConfigDirectory() {
  if (const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
      xdg_config && *xdg_config)
    return std::filesystem::path(xdg_config);

  for (const auto &var : {"HOME", "USERPROFILE"}) {
    if (const char *path = std::getenv(var); path && *path)
      return std::filesystem::path(path) / ".config";
  }

  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path(".") : cwd;
}

bool Config::Reload() {
  std::unique_lock lock{mutex_};

  json_ = nlohmann::json::object();

  auto path = GetConfigDirectory() / "punchcard.json";

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return false;

  std::ifstream stream{path};

  try {
    json_ = nlohmann::json::parse(stream);
  } catch (const nlohmann::json::exception &ex) {
    LogWarning() << "Ignoring " << path << ": " << ex.what() << std::endl;
    json_ = nlohmann::json::object();
  }

  if (!json_.is_object()) {
    LogWarning() << "Ignoring " << path << ": not a JSON object" << std::endl;
    json_ = nlohmann::json::object();
  }

  return true;
}
}  // namespace punchcard
