#ifndef __MCPV_SERVER_CONFIG_LOADER__
#define __MCPV_SERVER_CONFIG_LOADER__

#include "Headers.hpp"
#include "McpErrors.hpp"
#include "McpTypes.hpp"
#include "ServerInstance.hpp"
#include "SimpleIni.h"

namespace mcpv {
/**
 * @brief Everything the supervisor's config file describes.
 */
struct SupervisorSettings {
  InstanceOptions instanceOptions;
  /** @brief [Debug] verbose, when present. */
  optional<int> verbose;
  bool silent = false;
  string maxLogSize = "20971520";
  /** @brief One entry per [server:<id>] section, in file order. */
  vector<ServerConfig> servers;
};

/**
 * @brief Reads the supervisor INI file.
 *
 * Sections: [Supervisor] timeouts, [Debug] logging and one
 * [server:<id>] per tool server with repeatable `arg` and `env` keys.
 */
class ServerConfigLoader {
 public:
  /** @brief <config home>/mcpvisor/servers.ini */
  static string defaultConfigPath();

  /** @throws ConfigError if the file is unreadable or invalid. */
  static SupervisorSettings loadFile(const string& path);

  /** @throws ConfigError if the contents are invalid. */
  static SupervisorSettings loadString(const string& contents);

 protected:
  static SupervisorSettings parse(const CSimpleIniA& ini);

  static ServerConfig parseServer(const CSimpleIniA& ini,
                                  const string& section, const string& id);

  static std::chrono::milliseconds parseDuration(const CSimpleIniA& ini,
                                                 const char* key,
                                                 int defaultMs);
};
}  // namespace mcpv

#endif  // __MCPV_SERVER_CONFIG_LOADER__
