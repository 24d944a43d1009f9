#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace mcpv;

int main(int argc, char **argv) {
  el::Configurations conf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  HandleTerminate();

  // MCPV_TEST_VERBOSE=2 shows the wire traffic of the integration tests
  const char *verbose = getenv("MCPV_TEST_VERBOSE");
  if (verbose) {
    el::Loggers::setVerboseLevel(atoi(verbose));
  }

  Catch::Session session;
  int rc = session.applyCommandLine(argc, argv);
  if (rc != 0) {
    return rc;
  }

  string logDirectory = LogHandler::createTempLogDirectory("mcpvisor_test");
  if (!session.configData().listTests) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  LogHandler::setupLogFiles(&conf, logDirectory, "test", false, true);
  el::Loggers::reconfigureLogger("default", conf);

  int result = session.run();

  fs::remove_all(logDirectory);
  return result;
}
