#ifndef __MCPV_SERVER_MANAGER__
#define __MCPV_SERVER_MANAGER__

#include "EventChannel.hpp"
#include "Headers.hpp"
#include "McpErrors.hpp"
#include "McpTypes.hpp"
#include "ServerInstance.hpp"

namespace mcpv {
/**
 * @brief Registry of tool-server instances keyed by server id.
 *
 * Lifecycle operations on one id are serialized; different ids proceed
 * independently. Events of every instance are re-published on `events()`
 * from a single relay thread, in the order the instances raised them. A
 * listener may therefore call back into the manager, for example to restart
 * the server whose error it was just told about.
 */
class ServerManager {
 public:
  explicit ServerManager(const InstanceOptions& _options = InstanceOptions());

  /** @brief Drops listeners, drains the relay, then stops every instance. */
  virtual ~ServerManager();

  /**
   * @brief Starts the server described by `config`.
   *
   * If an instance with that id is running it is stopped first. The new
   * instance stays registered even if its start fails, so its error can be
   * inspected.
   * @throws SpawnError, HandshakeError as ServerInstance::start().
   */
  void startServer(const ServerConfig& config);

  /** @brief Stops and unregisters; unknown ids are a no-op. */
  void stopServer(const string& serverId);

  /**
   * @brief Stops `serverId`, then starts `config`, which may carry a
   * different id or launch descriptor.
   */
  void restartServer(const string& serverId, const ServerConfig& config);

  /** @brief Stops every instance concurrently and clears the registry. */
  void stopAll();

  /**
   * @throws ServerNotFoundError if no instance has that id.
   * @throws ServerNotReadyError and whatever the call itself raises.
   */
  ToolCallResult callTool(const string& serverId, const string& toolName,
                          const json& arguments);

  /** @throws ServerNotFoundError */
  vector<ResourceDescriptor> listResources(const string& serverId) const;

  vector<ResourceContent> readResource(const string& serverId,
                                       const string& uri);

  /** @throws ServerNotFoundError */
  vector<PromptDescriptor> listPrompts(const string& serverId) const;

  vector<PromptMessage> getPrompt(const string& serverId, const string& name,
                                  const map<string, string>& arguments);

  /** @brief Cached lists; empty for unknown ids. */
  vector<ToolDescriptor> getServerTools(const string& serverId) const;
  vector<ResourceDescriptor> getServerResources(const string& serverId) const;
  vector<PromptDescriptor> getServerPrompts(const string& serverId) const;

  /** @brief stopped for unknown ids. */
  ServerStatus getServerStatus(const string& serverId) const;

  optional<string> getServerError(const string& serverId) const;

  optional<ServerCapabilities> getServerCapabilities(
      const string& serverId) const;

  /** @brief Empty for unknown ids. */
  vector<LogEntry> getServerLogs(const string& serverId) const;

  void clearServerLogs(const string& serverId);

  /** @brief Every registered id, sorted. */
  vector<string> getServerIds() const;

  bool hasServer(const string& serverId) const;

  EventChannel<ServerEvent>& events() { return eventChannel; }

 protected:
  struct Registration {
    shared_ptr<ServerInstance> instance;
    int subscription;
  };

  shared_ptr<ServerInstance> findInstance(const string& serverId) const;

  /** @throws ServerNotFoundError */
  shared_ptr<ServerInstance> getInstance(const string& serverId) const;

  /** @brief Per-id lock serializing lifecycle operations. */
  shared_ptr<std::mutex> lifecycleLock(const string& serverId);

  /**
   * @brief Forgets the lock of an id that is no longer registered, unless
   * another thread is holding or waiting for it.
   */
  void releaseLifecycleLock(const string& serverId,
                            const shared_ptr<std::mutex>& idLock);

  /** @brief Hands an instance event to the relay thread. */
  void relayEvent(const ServerEvent& event);

  /** @brief Stop and unregister. Caller holds the id's lifecycle lock. */
  void stopLocked(const string& serverId);

  /** @brief Construction of a fresh instance. */
  virtual shared_ptr<ServerInstance> createInstance(
      const ServerConfig& config);

  InstanceOptions options;
  mutable std::mutex registryMutex;
  map<string, Registration> instances;
  map<string, shared_ptr<std::mutex>> lifecycleLocks;
  EventChannel<ServerEvent> eventChannel;
  /** @brief Guards `relayPool` against teardown. */
  std::mutex relayMutex;
  /** @brief One thread publishing instance events on `eventChannel`. */
  unique_ptr<ThreadPool> relayPool;
};
}  // namespace mcpv

#endif  // __MCPV_SERVER_MANAGER__
