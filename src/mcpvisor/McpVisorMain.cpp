#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "ServerConfigLoader.hpp"
#include "ServerManager.hpp"

using namespace mcpv;

namespace {
void printContent(const ToolCallResult& result) {
  for (const auto& item : result.content) {
    if (item.type == "text" && item.text) {
      CLOG(INFO, "stdout") << *item.text << endl;
    } else {
      CLOG(INFO, "stdout") << json(item).dump() << endl;
    }
  }
  if (!result.structuredContent.is_null()) {
    CLOG(INFO, "stdout") << result.structuredContent.dump(2) << endl;
  }
}

void printServer(const ServerManager& manager, const string& id) {
  ServerStatus status = manager.getServerStatus(id);
  CLOG(INFO, "stdout") << id << ": " << status << endl;
  optional<string> error = manager.getServerError(id);
  if (status == ServerStatus::ERROR && error) {
    CLOG(INFO, "stdout") << "  error: " << *error << endl;
  }
  for (const auto& tool : manager.getServerTools(id)) {
    CLOG(INFO, "stdout") << "  tool " << tool.name
                         << (tool.description.empty()
                                 ? string()
                                 : " - " + tool.description)
                         << endl;
  }
  for (const auto& resource : manager.getServerResources(id)) {
    CLOG(INFO, "stdout") << "  resource " << resource.uri << endl;
  }
  for (const auto& prompt : manager.getServerPrompts(id)) {
    CLOG(INFO, "stdout") << "  prompt " << prompt.name << endl;
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  mcpv::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, mcpv::InterruptSignalHandler);

  cxxopts::Options options("mcpvisor",
                           "Supervisor for MCP tool servers over stdio");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(
             ServerConfigLoader::defaultConfigPath()))  //
        ("list", "Print every server with its status and tools")  //
        ("call", "Call one tool, given as SERVER:TOOL",
         cxxopts::value<std::string>())  //
        ("args", "JSON object passed as the tool arguments",
         cxxopts::value<std::string>()->default_value("{}"))  //
        ("logs", "Print each server's log buffer before exiting")  //
        ("logtostdout", "log to stdout")                            //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "mcpvisor version " << MCPV_VERSION << endl;
      exit(0);
    }

    string cfgfilename = result["cfgfile"].as<string>();
    SupervisorSettings settings = ServerConfigLoader::loadFile(cfgfilename);

    // prioritize command line option over cfgfile
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else if (settings.verbose) {
      el::Loggers::setVerboseLevel(*settings.verbose);
    }
    if (settings.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    bool logToStdout = result.count("logtostdout") > 0;
    string logDir = result["logdir"].as<string>();
    if (logDir.empty()) {
      logDir = GetTempDirectory() + "mcpvisor";
    }
    LogHandler::setupLogFiles(&defaultConf, logDir, "mcpvisor", logToStdout,
                              true, settings.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("mcpvisor-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    ServerManager manager(settings.instanceOptions);
    for (const auto& config : settings.servers) {
      if (!config.enabled) {
        LOG(INFO) << "Skipping disabled server " << config.id;
        continue;
      }
      try {
        manager.startServer(config);
      } catch (const std::runtime_error& re) {
        LOG(ERROR) << "Server " << config.id << " failed to start: "
                   << re.what();
        CLOG(INFO, "stdout") << config.id << " failed: " << re.what() << endl;
        exitCode = 1;
      }
    }

    if (result.count("list")) {
      for (const string& id : manager.getServerIds()) {
        printServer(manager, id);
      }
    }

    if (result.count("call")) {
      string target = result["call"].as<string>();
      auto colon = target.find(':');
      if (colon == string::npos || colon == 0 || colon + 1 == target.size()) {
        CLOG(INFO, "stdout") << "--call expects SERVER:TOOL, got " << target
                             << endl;
        exitCode = 1;
      } else {
        try {
          json arguments = json::parse(result["args"].as<string>());
          ToolCallResult callResult = manager.callTool(
              target.substr(0, colon), target.substr(colon + 1), arguments);
          printContent(callResult);
          if (callResult.isError) {
            exitCode = 1;
          }
        } catch (const json::exception& je) {
          CLOG(INFO, "stdout") << "Invalid --args: " << je.what() << endl;
          exitCode = 1;
        } catch (const std::runtime_error& re) {
          CLOG(INFO, "stdout") << "Tool call failed: " << re.what() << endl;
          exitCode = 1;
        }
      }
    }

    if (result.count("logs")) {
      for (const string& id : manager.getServerIds()) {
        CLOG(INFO, "stdout") << "--- " << id << " ---" << endl;
        for (const auto& entry : manager.getServerLogs(id)) {
          CLOG(INFO, "stdout") << entry.toString() << endl;
        }
      }
    }

    manager.stopAll();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const ConfigError& ce) {
    CLOG(INFO, "stdout") << "Invalid config: " << ce.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
