#include "ServerInstance.hpp"

#include "MessageFramer.hpp"
#include "RawFdUtils.hpp"
#include "ThreadPool.h"

namespace mcpv {
namespace {
// Guards against servers that keep handing out cursors forever
const int MAX_LIST_PAGES = 64;
const size_t MAX_LOGGED_LINE = 200;

string truncateForLog(const string& line) {
  if (line.length() <= MAX_LOGGED_LINE) {
    return line;
  }
  return line.substr(0, MAX_LOGGED_LINE) + "...";
}
}  // namespace

ServerInstance::ServerInstance(const ServerConfig& _config,
                               const InstanceOptions& _options)
    : config(_config),
      options(_options),
      status(ServerStatus::STOPPED),
      readerShouldExit(false),
      logs(_options.maxLogEntries) {}

ServerInstance::~ServerInstance() {
  try {
    stop();
  } catch (const std::exception& ex) {
    STERROR << logPrefix() << "Error while stopping in destructor: "
            << ex.what();
  }
  events.clear();
}

string ServerInstance::logPrefix() const {
  return string("[MCP ") + (config.name.empty() ? config.id : config.name) +
         "] ";
}

void ServerInstance::start() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (!isIdleStatus(status)) {
      throw std::runtime_error("Server " + config.id +
                               " is already running (status: " +
                               serverStatusToString(status) + ")");
    }
  }

  // Leftovers of a previous crash
  releaseProcess("Server restarting", false);
  pendingRequests.resetIds();

  {
    lock_guard<recursive_mutex> guard(stateMutex);
    lastError.reset();
    clearServerState();
  }
  setStatus(ServerStatus::STARTING);
  string commandLine = config.command;
  for (const string& arg : config.args) {
    commandLine += " " + arg;
  }
  LOG(INFO) << logPrefix() << "Starting: " << commandLine;
  logs.add("Starting...");

  try {
    if (config.transport != "stdio") {
      throw SpawnError("Unsupported transport: " + config.transport);
    }
    if (config.command.empty()) {
      throw SpawnError("Command is required for stdio transport");
    }
    shared_ptr<Subprocess> proc =
        Subprocess::spawn(config.command, config.args, config.env);
    {
      lock_guard<recursive_mutex> guard(stateMutex);
      process = proc;
      pid = proc->getPid();
    }
    readerShouldExit = false;
    notificationPool.reset(new ThreadPool(1));
    readerThread.reset(
        new thread(&ServerInstance::runReader, this, proc));
  } catch (const SpawnError& se) {
    failStart(se.what());
    throw;
  }

  try {
    setStatus(ServerStatus::INITIALIZING);
    performHandshake();
  } catch (const std::exception& ex) {
    string message = ex.what();
    failStart(message);
    throw HandshakeError(message);
  }
}

void ServerInstance::performHandshake() {
  json initParams = {
      {"protocolVersion", MCP_PROTOCOL_VERSION},
      {"capabilities", json::object()},
      {"clientInfo",
       {{"name", options.clientName}, {"version", options.clientVersion}}}};
  json initResult = sendRequest("initialize", initParams);

  ServerCapabilities caps;
  try {
    caps = parseInitializeResult(initResult);
  } catch (const std::exception& ex) {
    throw ProtocolError(string("Malformed initialize result: ") + ex.what());
  }
  if (initResult.contains("serverInfo")) {
    VLOG(1) << logPrefix() << "Server info: " << initResult["serverInfo"];
  }
  if (initResult.contains("protocolVersion") &&
      initResult["protocolVersion"] != MCP_PROTOCOL_VERSION) {
    LOG(INFO) << logPrefix() << "Server speaks protocol "
              << initResult["protocolVersion"];
  }

  sendNotification("notifications/initialized", json(),
                   PendingRequestTable::Clock::now() + options.requestTimeout);

  if (caps.tools) {
    try {
      fetchTools();
    } catch (const std::exception& ex) {
      throw HandshakeError(string("Failed to list tools: ") + ex.what());
    }
  }
  // Resources and prompts are optional extras; a server that fails to list
  // them is still usable for tools.
  if (caps.resources) {
    try {
      fetchResources();
    } catch (const std::exception& ex) {
      LOG(WARNING) << logPrefix() << "Failed to list resources: " << ex.what();
      logs.add(string("Failed to list resources: ") + ex.what());
    }
  }
  if (caps.prompts) {
    try {
      fetchPrompts();
    } catch (const std::exception& ex) {
      LOG(WARNING) << logPrefix() << "Failed to list prompts: " << ex.what();
      logs.add(string("Failed to list prompts: ") + ex.what());
    }
  }

  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (status != ServerStatus::INITIALIZING) {
      throw HandshakeError(lastError ? *lastError
                                     : string("Server left initialization"));
    }
    // Capabilities become visible together with ready
    capabilities = caps;
    status = ServerStatus::READY;
  }
  VLOG(1) << logPrefix() << "Status: " << ServerStatus::READY;
  events.publish(ServerEvent::statusChanged(config.id, ServerStatus::READY));
  LOG(INFO) << logPrefix() << "Connected and ready";
  logs.add("Connected and ready");
}

void ServerInstance::stop() {
  lock_guard<std::mutex> lifecycleGuard(lifecycleMutex);
  shared_ptr<Subprocess> proc;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (status == ServerStatus::STOPPED) {
      return;
    }
    if (status != ServerStatus::ERROR) {
      proc = process;
    }
  }
  if (!proc) {
    // Error state: reclaim what the crash left behind, keep the error
    releaseProcess("Server stopped", false);
    return;
  }

  setStatus(ServerStatus::STOPPING);
  LOG(INFO) << logPrefix() << "Stopping...";
  logs.add("Stopping...");

  // The grace period covers delivering the notification and the exit
  auto graceEnd = std::chrono::steady_clock::now() + options.shutdownGrace;
  try {
    sendNotification("notifications/shutdown", json(), graceEnd);
  } catch (const std::exception& ex) {
    VLOG(1) << logPrefix()
            << "Could not deliver shutdown notification: " << ex.what();
  }
  proc->closeStdin();
  auto graceLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
      graceEnd - std::chrono::steady_clock::now());
  if (!proc->waitForExit(max(graceLeft, std::chrono::milliseconds(0)))) {
    LOG(INFO) << logPrefix()
              << "Did not exit within the grace period, sending SIGTERM";
    proc->sendSignal(SIGTERM);
    if (!proc->waitForExit(options.killEscalation)) {
      LOG(WARNING) << logPrefix() << "Ignored SIGTERM, sending SIGKILL";
      proc->sendSignal(SIGKILL);
    }
  }

  pendingRequests.rejectAll("Server stopped", false);
  releaseProcess("Server stopped", false);
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    clearServerState();
  }
  setStatus(ServerStatus::STOPPED);
  LOG(INFO) << logPrefix() << "Stopped";
  logs.add("Stopped");
}

void ServerInstance::releaseProcess(const string& pendingReason,
                                    bool crashed) {
  readerShouldExit = true;
  if (readerThread) {
    if (readerThread->joinable()) {
      readerThread->join();
    }
    readerThread.reset();
  }
  // Nothing can answer requests anymore; wake up whoever still waits before
  // joining the worker that might be one of them.
  pendingRequests.rejectAll(pendingReason, crashed);
  notificationPool.reset();

  shared_ptr<Subprocess> proc;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    proc.swap(process);
    pid.reset();
  }
  if (!proc) {
    return;
  }
  proc->closeStdin();
  if (!proc->poll()) {
    proc->sendSignal(SIGTERM);
    if (!proc->waitForExit(options.killEscalation)) {
      proc->sendSignal(SIGKILL);
    }
  }
  // The destructor reaps the child and closes whatever is still open
  proc.reset();
}

void ServerInstance::clearServerState() {
  capabilities.reset();
  tools.clear();
  resources.clear();
  prompts.clear();
}

bool ServerInstance::enterErrorState(const string& message,
                                     const string& pendingReason) {
  shared_ptr<Subprocess> proc;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (status == ServerStatus::ERROR) {
      return false;
    }
    status = ServerStatus::ERROR;
    lastError = message;
    clearServerState();
    pid.reset();
    proc = process;
  }
  LOG(ERROR) << logPrefix() << message;
  logs.add("Error: " + message);

  // Close stdin first so that no new request can reach the child after the
  // table has been drained.
  if (proc) {
    proc->closeStdin();
  }
  pendingRequests.rejectAll(pendingReason, true);
  if (proc) {
    proc->sendSignal(SIGKILL);
  }

  events.publish(ServerEvent::statusChanged(config.id, ServerStatus::ERROR));
  events.publish(ServerEvent::errorRaised(config.id, message));
  return true;
}

void ServerInstance::failStart(const string& message) {
  enterErrorState(message, "Server failed to start: " + message);
  releaseProcess("Server failed to start: " + message, true);
}

void ServerInstance::setStatus(ServerStatus newStatus) {
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    status = newStatus;
  }
  VLOG(1) << logPrefix() << "Status: " << newStatus;
  events.publish(ServerEvent::statusChanged(config.id, newStatus));
}

void ServerInstance::requireReady() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  if (status != ServerStatus::READY) {
    throw ServerNotReadyError("Server " + config.id +
                              " is not ready (status: " +
                              serverStatusToString(status) + ")");
  }
}

json ServerInstance::sendRequest(const string& method, const json& params) {
  int64_t id = pendingRequests.nextId();
  Deadline deadline =
      PendingRequestTable::Clock::now() + options.requestTimeout;
  std::future<json> response = pendingRequests.add(id, method, deadline);
  VLOG(2) << logPrefix() << "-> " << method << " #" << id;
  try {
    writeMessage(JsonRpc::encodeRequest(id, method, params), deadline);
  } catch (const WriteTimeoutError& wte) {
    LOG(WARNING) << logPrefix() << "Timed out sending " << method << ": "
                 << wte.what();
    pendingRequests.fail(id, std::make_exception_ptr(RequestTimeoutError(
                                 string("Request timed out: ") + method)));
    handleWriteTimeout(wte);
  } catch (const std::exception& ex) {
    LOG(WARNING) << logPrefix() << "Failed to send " << method << ": "
                 << ex.what();
    pendingRequests.fail(id, std::current_exception());
  }
  return response.get();
}

void ServerInstance::sendNotification(const string& method,
                                      const json& params, Deadline deadline) {
  VLOG(2) << logPrefix() << "-> " << method;
  try {
    writeMessage(JsonRpc::encodeNotification(method, params), deadline);
  } catch (const WriteTimeoutError& wte) {
    handleWriteTimeout(wte);
    throw;
  }
}

void ServerInstance::writeMessage(const string& payload, Deadline deadline) {
  shared_ptr<Subprocess> proc;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    proc = process;
  }
  if (!proc) {
    throw std::logic_error("Cannot send to " + config.id +
                           ": no subprocess attached");
  }
  proc->write(payload, deadline);
}

void ServerInstance::handleWriteTimeout(const WriteTimeoutError& wte) {
  if (wte.getBytesWritten() == 0) {
    return;
  }
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (status == ServerStatus::STOPPING || status == ServerStatus::STOPPED) {
      return;
    }
  }
  string message = string("Server stopped reading its input (") +
                   wte.what() + ")";
  enterErrorState(message, "Server crashed: " + message);
}

json ServerInstance::requestAllPages(const string& method, const string& key) {
  json merged = json::array();
  json params = json::object();
  for (int page = 0; page < MAX_LIST_PAGES; page++) {
    json result = sendRequest(method, params);
    if (!result.is_object()) {
      throw ProtocolError(method + " result must be an object, got " +
                          result.type_name());
    }
    auto items = result.find(key);
    if (items != result.end() && items->is_array()) {
      for (const auto& item : *items) {
        merged.push_back(item);
      }
    }
    auto cursor = result.find("nextCursor");
    if (cursor == result.end() || !cursor->is_string() ||
        cursor->get<string>().empty()) {
      return json{{key, merged}};
    }
    params["cursor"] = *cursor;
  }
  LOG(WARNING) << logPrefix() << method << " returned more than "
               << MAX_LIST_PAGES << " pages, truncating";
  return json{{key, merged}};
}

void ServerInstance::fetchTools() {
  vector<ToolDescriptor> newTools =
      parseToolList(requestAllPages("tools/list", "tools"));
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    tools = newTools;
  }
  LOG(INFO) << logPrefix() << "Received " << newTools.size() << " tools";
  logs.add("Loaded " + to_string(newTools.size()) + " tools");
  events.publish(ServerEvent::toolsUpdated(config.id, newTools));
}

void ServerInstance::fetchResources() {
  vector<ResourceDescriptor> newResources =
      parseResourceList(requestAllPages("resources/list", "resources"));
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    resources = newResources;
  }
  VLOG(1) << logPrefix() << "Received " << newResources.size()
          << " resources";
  events.publish(ServerEvent::resourcesUpdated(config.id, newResources));
}

void ServerInstance::fetchPrompts() {
  vector<PromptDescriptor> newPrompts =
      parsePromptList(requestAllPages("prompts/list", "prompts"));
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    prompts = newPrompts;
  }
  VLOG(1) << logPrefix() << "Received " << newPrompts.size() << " prompts";
  events.publish(ServerEvent::promptsUpdated(config.id, newPrompts));
}

void ServerInstance::scheduleRefresh(const string& what) {
  if (!notificationPool) {
    return;
  }
  notificationPool->enqueue([this, what]() {
    if (getStatus() != ServerStatus::READY) {
      VLOG(1) << logPrefix() << "Skipping " << what << " refresh while "
              << getStatus();
      return;
    }
    try {
      if (what == "tools") {
        fetchTools();
      } else if (what == "resources") {
        fetchResources();
      } else {
        fetchPrompts();
      }
    } catch (const std::exception& ex) {
      LOG(WARNING) << logPrefix() << "Failed to refresh " << what << ": "
                   << ex.what();
      logs.add("Failed to refresh " + what + ": " + ex.what());
    }
  });
}

ToolCallResult ServerInstance::callTool(const string& name,
                                        const json& arguments) {
  requireReady();
  LOG(INFO) << logPrefix() << "Calling tool: " << name;
  logs.add("Calling tool: " + name);
  json params = {{"name", name},
                 {"arguments", arguments.is_null() ? json::object() : arguments}};
  json result;
  try {
    result = sendRequest("tools/call", params);
  } catch (const std::exception& ex) {
    logs.add("Tool " + name + " failed: " + ex.what());
    throw;
  }
  try {
    return parseToolCallResult(result);
  } catch (const ProtocolError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProtocolError(string("Malformed tools/call result: ") + ex.what());
  }
}

vector<ResourceContent> ServerInstance::readResource(const string& uri) {
  requireReady();
  VLOG(1) << logPrefix() << "Reading resource: " << uri;
  json result = sendRequest("resources/read", json{{"uri", uri}});
  try {
    return parseResourceContents(result);
  } catch (const ProtocolError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProtocolError(string("Malformed resources/read result: ") +
                        ex.what());
  }
}

vector<PromptMessage> ServerInstance::getPrompt(
    const string& name, const map<string, string>& arguments) {
  requireReady();
  VLOG(1) << logPrefix() << "Getting prompt: " << name;
  json params = {{"name", name}, {"arguments", json(arguments)}};
  json result = sendRequest("prompts/get", params);
  try {
    return parsePromptMessages(result);
  } catch (const ProtocolError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProtocolError(string("Malformed prompts/get result: ") + ex.what());
  }
}

ServerStatus ServerInstance::getStatus() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return status;
}

optional<ServerCapabilities> ServerInstance::getCapabilities() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return capabilities;
}

vector<ToolDescriptor> ServerInstance::getTools() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return tools;
}

vector<ResourceDescriptor> ServerInstance::getResources() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return resources;
}

vector<PromptDescriptor> ServerInstance::getPrompts() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return prompts;
}

optional<string> ServerInstance::getLastError() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return lastError;
}

optional<pid_t> ServerInstance::getPid() const {
  lock_guard<recursive_mutex> guard(stateMutex);
  return pid;
}

void ServerInstance::runReader(shared_ptr<Subprocess> proc) {
  el::Helpers::setThreadName("mcp-" + config.id);
  MessageFramer stdoutFramer;
  MessageFramer stderrFramer;
  int stdoutFd = proc->getStdoutFd();
  int stderrFd = proc->getStderrFd();

  while (!readerShouldExit) {
    fd_set rfd;
    FD_ZERO(&rfd);
    int maxfd = -1;
    if (stdoutFd >= 0) {
      FD_SET(stdoutFd, &rfd);
      maxfd = max(maxfd, stdoutFd);
    }
    if (stderrFd >= 0) {
      FD_SET(stderrFd, &rfd);
      maxfd = max(maxfd, stderrFd);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int rc = select(maxfd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0 && GetErrno() != EINTR) {
      handleProcessError(proc, string("select failed: ") +
                                   strerror(GetErrno()));
      break;
    }

    try {
      if (rc > 0 && stdoutFd >= 0 && FD_ISSET(stdoutFd, &rfd)) {
        if (!pumpPipe(stdoutFd, &stdoutFramer, true)) {
          VLOG(1) << logPrefix() << "stdout closed";
          stdoutFd = -1;
        }
      }
      if (rc > 0 && stderrFd >= 0 && FD_ISSET(stderrFd, &rfd)) {
        if (!pumpPipe(stderrFd, &stderrFramer, false)) {
          stderrFd = -1;
        }
      }
    } catch (const std::runtime_error& re) {
      handleProcessError(proc,
                         string("Error reading from server: ") + re.what());
      break;
    }

    pendingRequests.expire(PendingRequestTable::Clock::now());

    if (proc->poll()) {
      // Whatever the child wrote before exiting still counts
      try {
        if (stdoutFd >= 0) {
          pumpPipe(stdoutFd, &stdoutFramer, true);
        }
        if (stderrFd >= 0) {
          pumpPipe(stderrFd, &stderrFramer, false);
        }
      } catch (const std::runtime_error& re) {
        VLOG(1) << logPrefix() << "Error draining pipes: " << re.what();
      }
      // A descendant may still hold stdout open; the last line counts anyway
      optional<string> last = stdoutFramer.flush();
      if (last) {
        handleStdoutLine(*last);
      }
      handleProcessExit(proc);
      break;
    }
  }
  proc->closeOutputs();
}

bool ServerInstance::pumpPipe(int fd, MessageFramer* framer, bool isStdout) {
  string chunk;
  bool open = RawFdUtils::readAvailable(fd, &chunk);
  vector<string> lines = framer->append(chunk);
  if (!open) {
    optional<string> last = framer->flush();
    if (last) {
      lines.push_back(*last);
    }
  }
  for (const string& line : lines) {
    if (isStdout) {
      handleStdoutLine(line);
    } else {
      handleStderrLine(line);
    }
  }
  return open;
}

void ServerInstance::handleStdoutLine(const string& line) {
  string trimmed = trim(line);
  if (trimmed.empty()) {
    return;
  }
  JsonRpcMessage message;
  try {
    message = JsonRpc::parse(trimmed);
  } catch (const std::exception& ex) {
    LOG(WARNING) << logPrefix() << "Discarding malformed output ("
                 << ex.what() << "): " << truncateForLog(trimmed);
    logs.add("Discarded malformed output: " + truncateForLog(trimmed));
    return;
  }
  handleMessage(message);
}

void ServerInstance::handleStderrLine(const string& line) {
  string trimmed = trim(line);
  if (trimmed.empty()) {
    return;
  }
  VLOG(1) << logPrefix() << "stderr: " << trimmed;
  logs.add(trimmed);
}

void ServerInstance::handleMessage(const JsonRpcMessage& message) {
  switch (message.kind) {
    case MessageKind::RESPONSE: {
      optional<int64_t> id = JsonRpc::numericId(message.id);
      if (!id) {
        VLOG(1) << logPrefix() << "Dropping response with foreign id "
                << message.id;
        return;
      }
      bool matched = message.error
                         ? pendingRequests.reject(*id, *message.error)
                         : pendingRequests.resolve(*id, message.result);
      if (!matched) {
        VLOG(1) << logPrefix() << "Dropping response for unknown request #"
                << *id;
      }
      return;
    }
    case MessageKind::NOTIFICATION:
      handleNotification(message);
      return;
    case MessageKind::REQUEST:
      handleServerRequest(message);
      return;
  }
}

void ServerInstance::handleNotification(const JsonRpcMessage& message) {
  VLOG(2) << logPrefix() << "<- " << message.method;
  if (message.method == "notifications/tools/list_changed") {
    scheduleRefresh("tools");
  } else if (message.method == "notifications/resources/list_changed") {
    scheduleRefresh("resources");
  } else if (message.method == "notifications/prompts/list_changed") {
    scheduleRefresh("prompts");
  } else if (message.method == "notifications/message") {
    string level = "info";
    string text;
    if (message.params.is_object()) {
      if (message.params.contains("level") &&
          message.params["level"].is_string()) {
        level = message.params["level"].get<string>();
      }
      if (message.params.contains("data")) {
        const json& data = message.params["data"];
        text = data.is_string() ? data.get<string>() : data.dump();
      }
    }
    logs.add("[" + level + "] " + text);
  } else {
    VLOG(1) << logPrefix() << "Ignoring notification " << message.method;
  }
}

void ServerInstance::handleServerRequest(const JsonRpcMessage& message) {
  VLOG(1) << logPrefix() << "Server request: " << message.method;
  string reply;
  if (message.method == "ping") {
    reply = JsonRpc::encodeResult(message.id, json::object());
  } else {
    reply = JsonRpc::encodeError(message.id, JSONRPC_METHOD_NOT_FOUND,
                                 "Method not found: " + message.method);
  }
  if (!notificationPool) {
    return;
  }
  string method = message.method;
  notificationPool->enqueue([this, reply, method]() {
    try {
      writeMessage(reply, PendingRequestTable::Clock::now() +
                              options.requestTimeout);
    } catch (const WriteTimeoutError& wte) {
      LOG(WARNING) << logPrefix() << "Could not answer " << method << ": "
                   << wte.what();
      handleWriteTimeout(wte);
    } catch (const std::exception& ex) {
      LOG(WARNING) << logPrefix() << "Could not answer " << method << ": "
                   << ex.what();
    }
  });
}

void ServerInstance::handleProcessExit(const shared_ptr<Subprocess>& proc) {
  string description = proc->describeExit();
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (status == ServerStatus::STOPPING || status == ServerStatus::STOPPED ||
        status == ServerStatus::ERROR) {
      VLOG(1) << logPrefix() << "Process " << description;
      return;
    }
  }
  string message = "Server crashed: " + description;
  enterErrorState(message, message);
}

void ServerInstance::handleProcessError(const shared_ptr<Subprocess>& proc,
                                        const string& error) {
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (status == ServerStatus::STOPPING || status == ServerStatus::STOPPED ||
        status == ServerStatus::ERROR) {
      VLOG(1) << logPrefix() << error;
      return;
    }
  }
  if (enterErrorState(error, "Server crashed: " + error)) {
    proc->waitForExit(options.killEscalation);
  }
}
}  // namespace mcpv
