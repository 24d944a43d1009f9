#include "ServerConfigLoader.hpp"

#include "sago/platform_folders.h"

namespace mcpv {
namespace {
const char SERVER_SECTION_PREFIX[] = "server:";

vector<string> allValues(const CSimpleIniA& ini, const string& section,
                         const char* key) {
  CSimpleIniA::TNamesDepend values;
  vector<string> result;
  if (!ini.GetAllValues(section.c_str(), key, values)) {
    return result;
  }
  // Keep the order the keys appear in the file
  values.sort(CSimpleIniA::Entry::LoadOrder());
  for (const auto& value : values) {
    result.push_back(value.pItem);
  }
  return result;
}

bool parseFlag(const CSimpleIniA& ini, const string& section, const char* key,
               bool defaultValue) {
  return ini.GetBoolValue(section.c_str(), key, defaultValue);
}
}  // namespace

string ServerConfigLoader::defaultConfigPath() {
  return (fs::path(sago::getConfigHome()) / "mcpvisor" / "servers.ini")
      .string();
}

SupervisorSettings ServerConfigLoader::loadFile(const string& path) {
  CSimpleIniA ini(true, true, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw ConfigError("Cannot load config file " + path + " (error " +
                      to_string(int(rc)) + ")");
  }
  LOG(INFO) << "Loaded config file " << path;
  return parse(ini);
}

SupervisorSettings ServerConfigLoader::loadString(const string& contents) {
  CSimpleIniA ini(true, true, false);
  SI_Error rc = ini.LoadData(contents);
  if (rc < 0) {
    throw ConfigError("Cannot parse config (error " + to_string(int(rc)) +
                      ")");
  }
  return parse(ini);
}

std::chrono::milliseconds ServerConfigLoader::parseDuration(
    const CSimpleIniA& ini, const char* key, int defaultMs) {
  const char* value = ini.GetValue("Supervisor", key, NULL);
  if (value == NULL) {
    return std::chrono::milliseconds(defaultMs);
  }
  long ms;
  try {
    size_t used;
    ms = stol(value, &used);
    if (used != strlen(value)) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw ConfigError(string("Supervisor.") + key +
                      " is not a number: " + value);
  }
  if (ms <= 0) {
    throw ConfigError(string("Supervisor.") + key + " must be positive");
  }
  return std::chrono::milliseconds(ms);
}

SupervisorSettings ServerConfigLoader::parse(const CSimpleIniA& ini) {
  SupervisorSettings settings;
  settings.instanceOptions.requestTimeout =
      parseDuration(ini, "request_timeout_ms", DEFAULT_REQUEST_TIMEOUT_MS);
  settings.instanceOptions.shutdownGrace =
      parseDuration(ini, "shutdown_grace_ms", DEFAULT_SHUTDOWN_GRACE_MS);
  settings.instanceOptions.killEscalation =
      parseDuration(ini, "kill_escalation_ms", DEFAULT_KILL_ESCALATION_MS);

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    settings.verbose = atoi(vlevel);
  }
  settings.silent = parseFlag(ini, "Debug", "silent", false);
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize) {
    settings.maxLogSize = logsize;
  }

  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  sections.sort(CSimpleIniA::Entry::LoadOrder());
  set<string> seen;
  for (const auto& section : sections) {
    string name = section.pItem;
    if (name.find(SERVER_SECTION_PREFIX) != 0) {
      continue;
    }
    string id = trim(name.substr(strlen(SERVER_SECTION_PREFIX)));
    if (id.empty()) {
      throw ConfigError("Server section without an id: [" + name + "]");
    }
    if (!seen.insert(id).second) {
      throw ConfigError("Duplicate server id: " + id);
    }
    settings.servers.push_back(parseServer(ini, name, id));
  }
  VLOG(1) << "Config describes " << settings.servers.size() << " servers";
  return settings;
}

ServerConfig ServerConfigLoader::parseServer(const CSimpleIniA& ini,
                                             const string& section,
                                             const string& id) {
  ServerConfig config;
  config.id = id;
  config.name = ini.GetValue(section.c_str(), "name", id.c_str());
  config.command = trim(ini.GetValue(section.c_str(), "command", ""));
  if (config.command.empty()) {
    throw ConfigError("Server " + id + " has no command");
  }
  config.args = allValues(ini, section, "arg");
  for (const string& pair : allValues(ini, section, "env")) {
    auto equals = pair.find('=');
    if (equals == string::npos || equals == 0) {
      throw ConfigError("Server " + id + " has a malformed env entry: " +
                        pair);
    }
    config.env[trim(pair.substr(0, equals))] = pair.substr(equals + 1);
  }
  config.transport = ini.GetValue(section.c_str(), "transport", "stdio");
  config.enabled = parseFlag(ini, section, "enabled", true);
  config.autoStart = parseFlag(ini, section, "auto_start", false);
  return config;
}
}  // namespace mcpv
