#include "ServerManager.hpp"

#include "ThreadPool.h"

namespace mcpv {
ServerManager::ServerManager(const InstanceOptions& _options)
    : options(_options), relayPool(new ThreadPool(1)) {}

ServerManager::~ServerManager() {
  eventChannel.clear();
  unique_ptr<ThreadPool> pool;
  {
    lock_guard<std::mutex> guard(relayMutex);
    pool.swap(relayPool);
  }
  // Joins the relay after whatever it already queued
  pool.reset();
  stopAll();
}

void ServerManager::relayEvent(const ServerEvent& event) {
  lock_guard<std::mutex> guard(relayMutex);
  if (!relayPool) {
    return;
  }
  relayPool->enqueue([this, event]() {
    try {
      eventChannel.publish(event);
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Listener failed on event for " << event.serverId << ": "
                 << ex.what();
    }
  });
}

shared_ptr<ServerInstance> ServerManager::createInstance(
    const ServerConfig& config) {
  return shared_ptr<ServerInstance>(new ServerInstance(config, options));
}

shared_ptr<std::mutex> ServerManager::lifecycleLock(const string& serverId) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = lifecycleLocks.find(serverId);
  if (it == lifecycleLocks.end()) {
    it = lifecycleLocks
             .insert(make_pair(serverId, shared_ptr<std::mutex>(new std::mutex())))
             .first;
  }
  return it->second;
}

void ServerManager::releaseLifecycleLock(const string& serverId,
                                         const shared_ptr<std::mutex>& idLock) {
  lock_guard<std::mutex> guard(registryMutex);
  if (instances.find(serverId) != instances.end()) {
    return;
  }
  auto it = lifecycleLocks.find(serverId);
  // One reference in the map, one held by the caller
  if (it != lifecycleLocks.end() && it->second == idLock &&
      idLock.use_count() <= 2) {
    lifecycleLocks.erase(it);
  }
}

shared_ptr<ServerInstance> ServerManager::findInstance(
    const string& serverId) const {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = instances.find(serverId);
  if (it == instances.end()) {
    return nullptr;
  }
  return it->second.instance;
}

shared_ptr<ServerInstance> ServerManager::getInstance(
    const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  if (!instance) {
    throw ServerNotFoundError(serverId);
  }
  return instance;
}

void ServerManager::startServer(const ServerConfig& config) {
  shared_ptr<std::mutex> idLock = lifecycleLock(config.id);
  lock_guard<std::mutex> idGuard(*idLock);

  if (findInstance(config.id)) {
    LOG(INFO) << "Server " << config.id << " already registered, replacing it";
    stopLocked(config.id);
  }

  shared_ptr<ServerInstance> instance = createInstance(config);
  int subscription = instance->getEvents().subscribe(
      [this](const ServerEvent& event) { relayEvent(event); });
  {
    lock_guard<std::mutex> guard(registryMutex);
    instances[config.id] = Registration{instance, subscription};
  }
  instance->start();
}

void ServerManager::stopServer(const string& serverId) {
  shared_ptr<std::mutex> idLock = lifecycleLock(serverId);
  lock_guard<std::mutex> idGuard(*idLock);
  stopLocked(serverId);
  releaseLifecycleLock(serverId, idLock);
}

void ServerManager::stopLocked(const string& serverId) {
  Registration registration;
  {
    lock_guard<std::mutex> guard(registryMutex);
    auto it = instances.find(serverId);
    if (it == instances.end()) {
      VLOG(1) << "Not stopping unknown server " << serverId;
      return;
    }
    registration = it->second;
  }
  // Stopped (and error) transitions still reach listeners
  registration.instance->stop();
  registration.instance->getEvents().unsubscribe(registration.subscription);
  {
    lock_guard<std::mutex> guard(registryMutex);
    auto it = instances.find(serverId);
    if (it != instances.end() &&
        it->second.instance == registration.instance) {
      instances.erase(it);
    }
  }
}

void ServerManager::restartServer(const string& serverId,
                                  const ServerConfig& config) {
  LOG(INFO) << "Restarting server " << serverId;
  stopServer(serverId);
  startServer(config);
}

void ServerManager::stopAll() {
  vector<string> ids = getServerIds();
  if (ids.empty()) {
    return;
  }
  LOG(INFO) << "Stopping " << ids.size() << " servers";
  vector<thread> stoppers;
  for (const string& id : ids) {
    stoppers.emplace_back([this, id]() {
      try {
        stopServer(id);
      } catch (const std::exception& ex) {
        LOG(ERROR) << "Failed to stop " << id << ": " << ex.what();
      }
    });
  }
  for (auto& stopper : stoppers) {
    stopper.join();
  }
}

ToolCallResult ServerManager::callTool(const string& serverId,
                                       const string& toolName,
                                       const json& arguments) {
  return getInstance(serverId)->callTool(toolName, arguments);
}

vector<ResourceDescriptor> ServerManager::listResources(
    const string& serverId) const {
  return getInstance(serverId)->getResources();
}

vector<ResourceContent> ServerManager::readResource(const string& serverId,
                                                    const string& uri) {
  return getInstance(serverId)->readResource(uri);
}

vector<PromptDescriptor> ServerManager::listPrompts(
    const string& serverId) const {
  return getInstance(serverId)->getPrompts();
}

vector<PromptMessage> ServerManager::getPrompt(
    const string& serverId, const string& name,
    const map<string, string>& arguments) {
  return getInstance(serverId)->getPrompt(name, arguments);
}

vector<ToolDescriptor> ServerManager::getServerTools(
    const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  return instance ? instance->getTools() : vector<ToolDescriptor>();
}

vector<ResourceDescriptor> ServerManager::getServerResources(
    const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  return instance ? instance->getResources() : vector<ResourceDescriptor>();
}

vector<PromptDescriptor> ServerManager::getServerPrompts(
    const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  return instance ? instance->getPrompts() : vector<PromptDescriptor>();
}

ServerStatus ServerManager::getServerStatus(const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  return instance ? instance->getStatus() : ServerStatus::STOPPED;
}

optional<string> ServerManager::getServerError(const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  return instance ? instance->getLastError() : optional<string>();
}

optional<ServerCapabilities> ServerManager::getServerCapabilities(
    const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  return instance ? instance->getCapabilities()
                  : optional<ServerCapabilities>();
}

vector<LogEntry> ServerManager::getServerLogs(const string& serverId) const {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  return instance ? instance->getLogs() : vector<LogEntry>();
}

void ServerManager::clearServerLogs(const string& serverId) {
  shared_ptr<ServerInstance> instance = findInstance(serverId);
  if (instance) {
    instance->clearLogs();
  }
}

vector<string> ServerManager::getServerIds() const {
  lock_guard<std::mutex> guard(registryMutex);
  vector<string> ids;
  for (const auto& it : instances) {
    ids.push_back(it.first);
  }
  return ids;
}

bool ServerManager::hasServer(const string& serverId) const {
  return findInstance(serverId) != nullptr;
}
}  // namespace mcpv
