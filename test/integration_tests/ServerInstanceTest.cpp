#include "ServerInstance.hpp"

#include "McpTestUtils.hpp"

using namespace mcpv;

TEST_CASE("ServerInstance happy path", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("happy"), fastOptions());
  EventRecorder recorder;
  instance.getEvents().subscribe(
      [&](const ServerEvent& event) { recorder.record(event); });

  REQUIRE(instance.getStatus() == ServerStatus::STOPPED);
  instance.start();
  REQUIRE(instance.getStatus() == ServerStatus::READY);
  REQUIRE(instance.getPid());
  REQUIRE(instance.getCapabilities());
  REQUIRE(instance.getCapabilities()->tools);
  REQUIRE(instance.getTools().size() == 5);
  REQUIRE(instance.getTools()[0].name == "echo");
  REQUIRE_FALSE(instance.getLastError());
  REQUIRE(recorder.statuses() ==
          vector<ServerStatus>({ServerStatus::STARTING,
                                ServerStatus::INITIALIZING,
                                ServerStatus::READY}));
  REQUIRE(recorder.count(ServerEventType::TOOLS_UPDATED) == 1);

  ToolCallResult result = instance.callTool("echo", {{"text", "hi"}});
  REQUIRE_FALSE(result.isError);
  REQUIRE(firstText(result) == "hi");

  ToolCallResult unknown = instance.callTool("nope", json());
  REQUIRE(unknown.isError);

  pid_t pid = *instance.getPid();
  instance.stop();
  REQUIRE(instance.getStatus() == ServerStatus::STOPPED);
  REQUIRE_FALSE(instance.getPid());
  REQUIRE_FALSE(instance.getCapabilities());
  REQUIRE(instance.getTools().empty());
  REQUIRE(processGone(pid));
  REQUIRE(recorder.statuses() ==
          vector<ServerStatus>({ServerStatus::STARTING,
                                ServerStatus::INITIALIZING,
                                ServerStatus::READY, ServerStatus::STOPPING,
                                ServerStatus::STOPPED}));

  auto logs = instance.getLogs();
  REQUIRE(logsContain(logs, "Connected and ready"));
  REQUIRE(logsContain(logs, "Calling tool: echo"));
  REQUIRE(logsContain(logs, "Stopped"));

  // Stopping twice is harmless
  instance.stop();
  REQUIRE(instance.getStatus() == ServerStatus::STOPPED);
}

TEST_CASE("ServerInstance rejects calls unless ready", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("idle"), fastOptions());
  REQUIRE_THROWS_AS(instance.callTool("echo", json::object()),
                    ServerNotReadyError);
  REQUIRE_THROWS_AS(instance.readResource("mem://greeting"),
                    ServerNotReadyError);
  REQUIRE_THROWS_AS(instance.getPrompt("greet", {}), ServerNotReadyError);
  REQUIRE(instance.getLogs().empty());

  instance.start();
  instance.stop();
  REQUIRE_THROWS_AS(instance.callTool("echo", json::object()),
                    ServerNotReadyError);
}

TEST_CASE("ServerInstance refuses to start twice", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("twice"), fastOptions());
  instance.start();
  REQUIRE_THROWS_AS(instance.start(), std::runtime_error);
  REQUIRE(instance.getStatus() == ServerStatus::READY);
}

TEST_CASE("ServerInstance crash fails pending calls", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("crash", {"--crash-on-call"}),
                          fastOptions());
  EventRecorder recorder;
  instance.getEvents().subscribe(
      [&](const ServerEvent& event) { recorder.record(event); });
  instance.start();
  pid_t pid = *instance.getPid();

  try {
    instance.callTool("echo", {{"text", "boom"}});
    FAIL("expected ServerTerminatedError");
  } catch (const ServerTerminatedError& ste) {
    REQUIRE(ste.wasCrash());
  }

  REQUIRE(waitFor([&]() {
    return instance.getStatus() == ServerStatus::ERROR;
  }));
  REQUIRE(instance.getLastError());
  REQUIRE_THAT(*instance.getLastError(),
               Catch::Matchers::ContainsSubstring("Server crashed"));
  REQUIRE_THAT(*instance.getLastError(),
               Catch::Matchers::ContainsSubstring("exited with code 1"));
  REQUIRE(instance.getPendingRequestCount() == 0);
  REQUIRE(instance.getTools().empty());
  REQUIRE_FALSE(instance.getPid());
  REQUIRE(waitFor([&]() { return processGone(pid); }));
  REQUIRE(waitFor([&]() {
    return recorder.count(ServerEventType::ERROR) == 1;
  }));
  REQUIRE(logsContain(instance.getLogs(), "crashing on purpose"));

  // stop() from error keeps the error visible
  instance.stop();
  REQUIRE(instance.getStatus() == ServerStatus::ERROR);

  // A crashed instance can be started again
  instance.start();
  REQUIRE(instance.getStatus() == ServerStatus::READY);
  REQUIRE_FALSE(instance.getLastError());
}

TEST_CASE("ServerInstance times out unanswered calls", "[ServerInstance]") {
  InstanceOptions options = fastOptions();
  options.requestTimeout = std::chrono::milliseconds(300);
  ServerInstance instance(
      mockServerConfig("timeout", {"--never-reply-to-call"}), options);
  instance.start();

  auto begin = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(instance.callTool("echo", {{"text", "x"}}),
                    RequestTimeoutError);
  auto elapsed = std::chrono::steady_clock::now() - begin;
  REQUIRE(elapsed >= std::chrono::milliseconds(300));
  REQUIRE(elapsed < std::chrono::milliseconds(3000));

  REQUIRE(instance.getStatus() == ServerStatus::READY);
  REQUIRE(instance.getPendingRequestCount() == 0);
  REQUIRE_FALSE(instance.getLastError());
}

TEST_CASE("ServerInstance gives up on a server that stops reading",
          "[ServerInstance]") {
  InstanceOptions options = fastOptions();
  options.requestTimeout = std::chrono::milliseconds(500);
  ServerInstance instance(mockServerConfig("deaf", {"--stop-reading"}),
                          options);
  instance.start();
  REQUIRE(instance.getStatus() == ServerStatus::READY);
  pid_t pid = *instance.getPid();

  // Far more than a pipe buffer holds
  string big(2 * 1024 * 1024, 'x');
  auto begin = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(instance.callTool("echo", {{"text", big}}),
                    RequestTimeoutError);
  REQUIRE(std::chrono::steady_clock::now() - begin <
          std::chrono::milliseconds(2500));
  REQUIRE(instance.getPendingRequestCount() == 0);

  // Half a message sits in its input, so the server cannot be trusted
  REQUIRE(instance.getStatus() == ServerStatus::ERROR);
  REQUIRE(instance.getLastError());
  REQUIRE_THAT(*instance.getLastError(),
               Catch::Matchers::ContainsSubstring("stopped reading its input"));
  REQUIRE_THROWS_AS(instance.callTool("echo", {{"text", "x"}}),
                    ServerNotReadyError);

  begin = std::chrono::steady_clock::now();
  instance.stop();
  REQUIRE(std::chrono::steady_clock::now() - begin <
          std::chrono::milliseconds(2000));
  REQUIRE(processGone(pid));
}

TEST_CASE("ServerInstance stops a server that stops reading",
          "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("deaf-stop", {"--stop-reading"}),
                          fastOptions());
  instance.start();
  pid_t pid = *instance.getPid();
  auto begin = std::chrono::steady_clock::now();
  instance.stop();
  REQUIRE(instance.getStatus() == ServerStatus::STOPPED);
  // Grace plus SIGTERM; the server dies on SIGTERM
  REQUIRE(std::chrono::steady_clock::now() - begin <
          std::chrono::milliseconds(2000));
  REQUIRE(processGone(pid));
}

TEST_CASE("ServerInstance reads an unterminated last reply",
          "[ServerInstance]") {
  ServerInstance instance(
      mockServerConfig("terse", {"--unterminated-reply"}), fastOptions());
  instance.start();
  ToolCallResult result = instance.callTool("echo", {{"text", "ignored"}});
  REQUIRE(firstText(result) == "last words");
  REQUIRE(waitFor([&]() {
    return instance.getStatus() == ServerStatus::ERROR;
  }));
  REQUIRE_THAT(*instance.getLastError(),
               Catch::Matchers::ContainsSubstring("exited with code 0"));
}

TEST_CASE("ServerInstance publishes capabilities together with ready",
          "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("caps"), fastOptions());
  std::atomic<int> capsWhileInitializing(0);
  std::atomic<int> toolsUpdates(0);
  std::atomic<bool> capsAtReady(false);
  instance.getEvents().subscribe([&](const ServerEvent& event) {
    if (event.type == ServerEventType::TOOLS_UPDATED) {
      toolsUpdates++;
      if (instance.getStatus() == ServerStatus::INITIALIZING &&
          instance.getCapabilities()) {
        capsWhileInitializing++;
      }
    }
    if (event.type == ServerEventType::STATUS_CHANGED &&
        event.status == ServerStatus::READY) {
      capsAtReady = bool(instance.getCapabilities());
    }
  });
  instance.start();
  REQUIRE(toolsUpdates == 1);
  REQUIRE(capsWhileInitializing == 0);
  REQUIRE(capsAtReady);
}

TEST_CASE("ServerInstance survives malformed output", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("garbage", {"--malformed-line"}),
                          fastOptions());
  instance.start();
  ToolCallResult result = instance.callTool("echo", {{"text", "still here"}});
  REQUIRE(firstText(result) == "still here");
  REQUIRE(instance.getStatus() == ServerStatus::READY);
  REQUIRE(logsContain(instance.getLogs(), "Discarded malformed output"));
}

TEST_CASE("ServerInstance surfaces JSON-RPC errors", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("rpcerror"), fastOptions());
  instance.start();
  try {
    instance.callTool("fail", json::object());
    FAIL("expected RpcError");
  } catch (const RpcError& re) {
    REQUIRE(re.getCode() == JSONRPC_INVALID_PARAMS);
    REQUIRE(string(re.what()) == "Invalid arguments for fail");
  }
  REQUIRE(instance.getStatus() == ServerStatus::READY);
  REQUIRE(firstText(instance.callTool("echo", {{"text", "ok"}})) == "ok");
}

TEST_CASE("ServerInstance spawn failures", "[ServerInstance]") {
  SECTION("Missing executable") {
    ServerConfig config = mockServerConfig("missing");
    config.command = "/nonexistent/mcpvisor-no-such-server";
    ServerInstance instance(config, fastOptions());
    REQUIRE_THROWS_AS(instance.start(), SpawnError);
    REQUIRE(instance.getStatus() == ServerStatus::ERROR);
    REQUIRE(instance.getLastError());
    REQUIRE_FALSE(instance.getPid());
  }

  SECTION("Unsupported transport") {
    ServerConfig config = mockServerConfig("sse");
    config.transport = "sse";
    ServerInstance instance(config, fastOptions());
    REQUIRE_THROWS_AS(instance.start(), SpawnError);
    REQUIRE(instance.getStatus() == ServerStatus::ERROR);
    REQUIRE(*instance.getLastError() == "Unsupported transport: sse");
  }

  SECTION("Empty command") {
    ServerConfig config = mockServerConfig("empty");
    config.command = "";
    ServerInstance instance(config, fastOptions());
    REQUIRE_THROWS_AS(instance.start(), SpawnError);
    REQUIRE(*instance.getLastError() ==
            "Command is required for stdio transport");
  }
}

TEST_CASE("ServerInstance handshake failures", "[ServerInstance]") {
  SECTION("Server exits before answering") {
    ServerInstance instance(
        mockServerConfig("early", {"--exit-immediately", "3"}),
        fastOptions());
    REQUIRE_THROWS_AS(instance.start(), HandshakeError);
    REQUIRE(instance.getStatus() == ServerStatus::ERROR);
    REQUIRE(instance.getLastError());
    REQUIRE(instance.getPendingRequestCount() == 0);
    REQUIRE_FALSE(instance.getPid());
  }

  SECTION("Server never answers initialize") {
    InstanceOptions options = fastOptions();
    options.requestTimeout = std::chrono::milliseconds(300);
    ServerInstance instance(
        mockServerConfig("mute", {"--no-initialize-reply"}), options);
    try {
      instance.start();
      FAIL("expected HandshakeError");
    } catch (const HandshakeError& he) {
      REQUIRE_THAT(he.what(), Catch::Matchers::ContainsSubstring("initialize"));
    }
    REQUIRE(instance.getStatus() == ServerStatus::ERROR);
    REQUIRE_THAT(*instance.getLastError(),
                 Catch::Matchers::ContainsSubstring("timed out"));
  }
}

TEST_CASE("ServerInstance request ids restart with the process",
          "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("ids"), fastOptions());
  instance.start();
  // initialize is 1 and tools/list is 2
  REQUIRE(firstText(instance.callTool("whoami", json())) == "3");
  REQUIRE(firstText(instance.callTool("whoami", json())) == "4");
  instance.stop();
  instance.start();
  REQUIRE(firstText(instance.callTool("whoami", json())) == "3");
}

TEST_CASE("ServerInstance accepts string response ids", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("strings", {"--string-ids"}),
                          fastOptions());
  instance.start();
  REQUIRE(instance.getTools().size() == 5);
  REQUIRE(firstText(instance.callTool("echo", {{"text", "str"}})) == "str");
}

TEST_CASE("ServerInstance matches concurrent out-of-order replies",
          "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("concurrent"), fastOptions());
  instance.start();
  auto slowCall = std::async(std::launch::async, [&]() {
    return instance.callTool("slow", {{"ms", 400}, {"tag", "slow"}});
  });
  auto fastCall = std::async(std::launch::async, [&]() {
    return instance.callTool("slow", {{"ms", 20}, {"tag", "fast"}});
  });
  REQUIRE(firstText(fastCall.get()) == "fast");
  REQUIRE(firstText(slowCall.get()) == "slow");
  REQUIRE(instance.getPendingRequestCount() == 0);
}

TEST_CASE("ServerInstance stop fails calls in flight", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("inflight"), fastOptions());
  instance.start();
  auto call = std::async(std::launch::async, [&]() {
    return instance.callTool("slow", {{"ms", 5000}, {"tag", "never"}});
  });
  REQUIRE(waitFor([&]() { return instance.getPendingRequestCount() == 1; }));
  instance.stop();
  try {
    call.get();
    FAIL("expected ServerTerminatedError");
  } catch (const ServerTerminatedError& ste) {
    REQUIRE_FALSE(ste.wasCrash());
  }
  REQUIRE(instance.getStatus() == ServerStatus::STOPPED);
}

TEST_CASE("ServerInstance escalates to kill", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("stubborn", {"--ignore-shutdown"}),
                          fastOptions());
  instance.start();
  pid_t pid = *instance.getPid();
  auto begin = std::chrono::steady_clock::now();
  instance.stop();
  auto elapsed = std::chrono::steady_clock::now() - begin;
  REQUIRE(instance.getStatus() == ServerStatus::STOPPED);
  REQUIRE(processGone(pid));
  // grace period plus SIGTERM escalation
  REQUIRE(elapsed >= std::chrono::milliseconds(800));
}

TEST_CASE("ServerInstance without tools", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("toolless", {"--no-tools"}),
                          fastOptions());
  instance.start();
  REQUIRE(instance.getStatus() == ServerStatus::READY);
  REQUIRE_FALSE(instance.getCapabilities()->tools);
  REQUIRE(instance.getTools().empty());
}

TEST_CASE("ServerInstance follows tool list pages", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("paged", {"--paged-tools"}),
                          fastOptions());
  instance.start();
  auto tools = instance.getTools();
  REQUIRE(tools.size() == 5);
  REQUIRE(tools[4].name == "log");
}

TEST_CASE("ServerInstance resources and prompts", "[ServerInstance]") {
  SECTION("Listed during the handshake") {
    ServerInstance instance(
        mockServerConfig("extras", {"--resources", "--prompts"}),
        fastOptions());
    instance.start();
    REQUIRE(instance.getResources().size() == 1);
    REQUIRE(instance.getResources()[0].uri == "mem://greeting");
    REQUIRE(instance.getPrompts().size() == 1);
    REQUIRE(instance.getPrompts()[0].name == "greet");

    auto contents = instance.readResource("mem://greeting");
    REQUIRE(contents.size() == 1);
    REQUIRE(contents[0].text == optional<string>("hello"));

    auto messages = instance.getPrompt("greet", {{"who", "bob"}});
    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0].content.text == optional<string>("Hello bob"));

    try {
      instance.readResource("mem://missing");
      FAIL("expected RpcError");
    } catch (const RpcError& re) {
      REQUIRE(re.getCode() == -32002);
    }
  }

  SECTION("Listing failures are not fatal") {
    ServerInstance instance(
        mockServerConfig("brokenres", {"--resources", "--fail-resources"}),
        fastOptions());
    instance.start();
    REQUIRE(instance.getStatus() == ServerStatus::READY);
    REQUIRE(instance.getResources().empty());
    REQUIRE(logsContain(instance.getLogs(), "Failed to list resources"));
  }
}

TEST_CASE("ServerInstance refetches tools on list_changed",
          "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("dynamic", {"--list-changed"}),
                          fastOptions());
  EventRecorder recorder;
  instance.getEvents().subscribe(
      [&](const ServerEvent& event) { recorder.record(event); });
  instance.start();
  REQUIRE(instance.getTools().size() == 6);
  REQUIRE(instance.getCapabilities()->toolsListChanged);

  REQUIRE(firstText(instance.callTool("add_tool", json())) == "added");
  REQUIRE(waitFor([&]() { return instance.getTools().size() == 7; }));
  REQUIRE(waitFor([&]() {
    return recorder.count(ServerEventType::TOOLS_UPDATED) == 2;
  }));
  auto events = recorder.snapshot();
  REQUIRE(events.back().type == ServerEventType::TOOLS_UPDATED);
  REQUIRE(events.back().tools.size() == 7);
}

TEST_CASE("ServerInstance captures server output in its logs",
          "[ServerInstance]") {
  SECTION("Log notifications") {
    ServerInstance instance(mockServerConfig("logger"), fastOptions());
    instance.start();
    instance.callTool("log", {{"text", "disk almost full"}});
    REQUIRE(logsContain(instance.getLogs(), "[warning] disk almost full"));
    instance.clearLogs();
    REQUIRE(instance.getLogs().empty());
  }

  SECTION("One entry per stderr line") {
    ServerInstance instance(mockServerConfig("chatty", {"--stderr-lines", "3"}),
                            fastOptions());
    instance.start();
    REQUIRE(waitFor([&]() {
      return logsContain(instance.getLogs(), "stderr line 2");
    }));
    auto logs = instance.getLogs();
    REQUIRE(logsContain(logs, "stderr line 0"));
    REQUIRE(logsContain(logs, "stderr line 1"));
  }

  SECTION("Log buffer is bounded") {
    InstanceOptions options = fastOptions();
    options.maxLogEntries = 5;
    ServerInstance instance(
        mockServerConfig("bounded", {"--stderr-lines", "20"}), options);
    instance.start();
    REQUIRE(waitFor([&]() {
      return logsContain(instance.getLogs(), "stderr line 19");
    }));
    REQUIRE(instance.getLogs().size() <= 5);
  }
}

TEST_CASE("ServerInstance answers server requests", "[ServerInstance]") {
  ServerInstance instance(mockServerConfig("pinger", {"--ping-client"}),
                          fastOptions());
  instance.start();
  REQUIRE(waitFor([&]() {
    return logsContain(instance.getLogs(), "pong received for \"mock-ping\"");
  }));
  REQUIRE(waitFor([&]() {
    return logsContain(instance.getLogs(),
                       "error received for \"mock-sampling\" code -32601");
  }));
  REQUIRE(instance.getStatus() == ServerStatus::READY);
}

TEST_CASE("ServerInstance destructor reclaims the process",
          "[ServerInstance]") {
  pid_t pid;
  {
    ServerInstance instance(mockServerConfig("scoped"), fastOptions());
    instance.start();
    pid = *instance.getPid();
  }
  REQUIRE(processGone(pid));
}
