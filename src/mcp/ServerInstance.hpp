#ifndef __MCPV_SERVER_INSTANCE__
#define __MCPV_SERVER_INSTANCE__

#include "EventChannel.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "JsonRpc.hpp"
#include "LogRingBuffer.hpp"
#include "McpErrors.hpp"
#include "McpTypes.hpp"
#include "PendingRequestTable.hpp"
#include "Subprocess.hpp"

class ThreadPool;

namespace mcpv {
class MessageFramer;

/**
 * @brief Timing and identity knobs of a `ServerInstance`.
 */
struct InstanceOptions {
  /** @brief How long a request may stay unanswered. */
  std::chrono::milliseconds requestTimeout =
      std::chrono::milliseconds(DEFAULT_REQUEST_TIMEOUT_MS);
  /** @brief How long stop() waits for a voluntary exit. */
  std::chrono::milliseconds shutdownGrace =
      std::chrono::milliseconds(DEFAULT_SHUTDOWN_GRACE_MS);
  /** @brief How long after SIGTERM before SIGKILL. */
  std::chrono::milliseconds killEscalation =
      std::chrono::milliseconds(DEFAULT_KILL_ESCALATION_MS);
  /** @brief clientInfo sent with initialize. */
  string clientName = "mcpvisor";
  string clientVersion = MCPV_VERSION;
  size_t maxLogEntries = MAX_SERVER_LOG_ENTRIES;
};

/**
 * @brief Owns one tool-server subprocess and speaks MCP with it over stdio.
 *
 * Lifecycle: stopped -> starting -> initializing -> ready -> stopping ->
 * stopped, with error reachable from starting, initializing and ready.
 * start() and stop() are serialized; every other method may be called from
 * any thread. A reader thread owns the output pipes: it frames stdout into
 * messages, resolves pending requests, enforces request timeouts and turns
 * an unexpected exit into the error state.
 *
 * Events are published on the thread that caused them (caller, reader or
 * notification worker) and outside of internal locks. Listeners must not
 * call start() or stop() on the same instance from inside a callback;
 * ServerManager relays events from its own thread for that purpose.
 *
 * The reader thread never writes to the child. Writes are bounded by a
 * deadline so a child that stops reading cannot stall timeouts or stop().
 */
class ServerInstance {
 public:
  ServerInstance(const ServerConfig& _config,
                 const InstanceOptions& _options = InstanceOptions());

  /** @brief Stops the server and reclaims every thread and descriptor. */
  virtual ~ServerInstance();

  const string& getId() const { return config.id; }

  const ServerConfig& getConfig() const { return config; }

  /**
   * @brief Spawns the subprocess and runs the whole handshake.
   *
   * Returns once the instance is ready. On failure the instance is left in
   * error with `getLastError()` set, and the failure is rethrown.
   * @throws std::runtime_error if the instance is not idle.
   * @throws SpawnError if the process could not be launched.
   * @throws HandshakeError if initialize or the tool listing failed.
   */
  void start();

  /**
   * @brief Asks the server to shut down, waits out the grace period, then
   * escalates SIGTERM -> SIGKILL. Ends in stopped; a no-op when stopped.
   * From error it only reclaims leftovers and keeps the error visible.
   */
  void stop();

  /**
   * @brief Invokes a tool and waits for its result.
   * @throws ServerNotReadyError unless ready; nothing is written then.
   * @throws RpcError, RequestTimeoutError, ServerTerminatedError.
   */
  ToolCallResult callTool(const string& name, const json& arguments);

  /** @brief resources/read. Same failure modes as callTool(). */
  vector<ResourceContent> readResource(const string& uri);

  /** @brief prompts/get. Same failure modes as callTool(). */
  vector<PromptMessage> getPrompt(const string& name,
                                  const map<string, string>& arguments);

  ServerStatus getStatus() const;

  /** @brief Set only while a handshake has succeeded since the last start. */
  optional<ServerCapabilities> getCapabilities() const;

  vector<ToolDescriptor> getTools() const;

  vector<ResourceDescriptor> getResources() const;

  vector<PromptDescriptor> getPrompts() const;

  optional<string> getLastError() const;

  /** @brief Set while a subprocess is attached. */
  optional<pid_t> getPid() const;

  /** @brief A copy of the log ring buffer, oldest first. */
  vector<LogEntry> getLogs() const { return logs.snapshot(); }

  void clearLogs() { logs.clear(); }

  size_t getPendingRequestCount() const { return pendingRequests.size(); }

  /** @brief Status, list and error changes of this instance. */
  EventChannel<ServerEvent>& getEvents() { return events; }

 protected:
  typedef std::chrono::steady_clock::time_point Deadline;

  /**
   * @brief Sends a request and blocks until its response, its timeout or
   * teardown, whichever comes first. The timeout also bounds the write.
   */
  json sendRequest(const string& method, const json& params);

  /** @brief Fire-and-forget notification, written before `deadline`. */
  void sendNotification(const string& method, const json& params,
                        Deadline deadline);

  /**
   * @brief Writes one encoded document to the child's stdin.
   * @throws std::logic_error when no subprocess is attached.
   * @throws WriteTimeoutError if the child does not read in time.
   */
  void writeMessage(const string& payload, Deadline deadline);

  /**
   * @brief A write that timed out halfway leaves a torn line in the child's
   * input, after which nothing it reads can be trusted: moves to error unless
   * the instance is already stopping.
   */
  void handleWriteTimeout(const WriteTimeoutError& wte);

  /**
   * @brief Requests `method` repeatedly while the server returns a
   * `nextCursor`, concatenating the `key` arrays of all pages.
   */
  json requestAllPages(const string& method, const string& key);

  void performHandshake();

  void fetchTools();
  void fetchResources();
  void fetchPrompts();

  /** @brief Runs a list refetch on the notification worker. */
  void scheduleRefresh(const string& what);

  /** @brief Body of the reader thread. */
  void runReader(shared_ptr<Subprocess> proc);

  /**
   * @brief Drains all readable bytes of one pipe through its framer. At end
   * of stream an unterminated last line is dispatched too.
   */
  bool pumpPipe(int fd, MessageFramer* framer, bool isStdout);

  void handleStdoutLine(const string& line);
  void handleStderrLine(const string& line);
  void handleMessage(const JsonRpcMessage& message);
  void handleNotification(const JsonRpcMessage& message);
  void handleServerRequest(const JsonRpcMessage& message);

  /** @brief Reader thread: the child exited. */
  void handleProcessExit(const shared_ptr<Subprocess>& proc);

  /** @brief Reader thread: reading the child's pipes failed. */
  void handleProcessError(const shared_ptr<Subprocess>& proc,
                          const string& error);

  /**
   * @brief Moves to error, stores the message, drains every pending request
   * and kills the child if it is still alive.
   * @return false if the instance was already in error.
   */
  bool enterErrorState(const string& message, const string& pendingReason);

  /** @brief start() failure path: error state plus full cleanup. */
  void failStart(const string& message);

  /**
   * @brief Joins the reader and the notification worker, then terminates
   * and reaps the child. Never called from those two threads.
   */
  void releaseProcess(const string& pendingReason, bool crashed);

  /** @brief Forgets capabilities, lists and pid. Caller holds stateMutex. */
  void clearServerState();

  void setStatus(ServerStatus newStatus);

  /** @brief Throws ServerNotReadyError unless ready. */
  void requireReady() const;

  /** @brief "[MCP name] " */
  string logPrefix() const;

  /** @brief Immutable launch descriptor. */
  const ServerConfig config;
  /** @brief Timeouts and client identity. */
  const InstanceOptions options;

  /** @brief Serializes start() and stop(). */
  std::mutex lifecycleMutex;
  /** @brief Guards every observable field below. */
  mutable recursive_mutex stateMutex;

  ServerStatus status;
  optional<ServerCapabilities> capabilities;
  vector<ToolDescriptor> tools;
  vector<ResourceDescriptor> resources;
  vector<PromptDescriptor> prompts;
  optional<string> lastError;
  optional<pid_t> pid;

  /** @brief The attached child, if any. */
  shared_ptr<Subprocess> process;
  /** @brief Reads the child's stdout/stderr. */
  unique_ptr<thread> readerThread;
  /** @brief Asks the reader thread to return. */
  std::atomic<bool> readerShouldExit;
  /** @brief Runs follow-up work for notifications off the reader thread. */
  unique_ptr<ThreadPool> notificationPool;

  PendingRequestTable pendingRequests;
  LogRingBuffer logs;
  EventChannel<ServerEvent> events;
};
}  // namespace mcpv

#endif  // __MCPV_SERVER_INSTANCE__
