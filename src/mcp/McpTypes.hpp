#ifndef __MCPV_MCP_TYPES__
#define __MCPV_MCP_TYPES__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace mcpv {
/**
 * @brief Lifecycle state of one tool-server instance.
 */
enum class ServerStatus {
  STOPPED,
  STARTING,
  INITIALIZING,
  READY,
  STOPPING,
  ERROR,
};

/** @brief Lower-case wire/display name ("ready"). */
string serverStatusToString(ServerStatus status);

/** @brief stopped and error are the idle states a start() may leave from. */
inline bool isIdleStatus(ServerStatus status) {
  return status == ServerStatus::STOPPED || status == ServerStatus::ERROR;
}

inline std::ostream& operator<<(std::ostream& os, ServerStatus status) {
  return os << serverStatusToString(status);
}

/**
 * @brief Immutable launch descriptor for one tool server, supplied by the
 * application layer.
 */
struct ServerConfig {
  /** @brief Unique registry key. */
  string id;
  /** @brief Display name used in logs. */
  string name;
  /** @brief Executable, looked up on PATH. */
  string command;
  vector<string> args;
  /** @brief Applied on top of the supervisor's own environment. */
  map<string, string> env;
  /** @brief Only "stdio" is implemented. */
  string transport = "stdio";
  bool enabled = true;
  bool autoStart = false;
};

/**
 * @brief Feature flags a server advertised in its initialize result.
 */
struct ServerCapabilities {
  bool tools = false;
  bool toolsListChanged = false;
  bool resources = false;
  bool resourcesSubscribe = false;
  bool resourcesListChanged = false;
  bool prompts = false;
  bool promptsListChanged = false;
  bool logging = false;
};

struct ToolDescriptor {
  string name;
  string description;
  json inputSchema;
};

struct ResourceDescriptor {
  string uri;
  string name;
  string description;
  string mimeType;
};

struct PromptArgument {
  string name;
  string description;
  bool required = false;
};

struct PromptDescriptor {
  string name;
  string description;
  vector<PromptArgument> arguments;
};

/**
 * @brief One element of a tool result or prompt message. Only the fields
 * matching `type` are set.
 */
struct ContentItem {
  /** @brief "text", "image", "audio", "resource" or "resource_link". */
  string type;
  optional<string> text;
  /** @brief Base64 payload for images and audio. */
  optional<string> data;
  optional<string> mimeType;
  /** @brief Embedded resource object, kept as sent. */
  json resource;
};

struct ToolCallResult {
  vector<ContentItem> content;
  bool isError = false;
  /** @brief Optional structuredContent, kept as sent. */
  json structuredContent;
};

struct ResourceContent {
  string uri;
  string mimeType;
  optional<string> text;
  optional<string> blob;
};

struct PromptMessage {
  /** @brief "user" or "assistant". */
  string role;
  ContentItem content;
};

/**
 * @brief What kind of change a `ServerEvent` reports.
 */
enum class ServerEventType {
  STATUS_CHANGED,
  TOOLS_UPDATED,
  RESOURCES_UPDATED,
  PROMPTS_UPDATED,
  ERROR,
};

/**
 * @brief A status, list or error change of one tool server. Only the member
 * matching `type` is meaningful.
 */
struct ServerEvent {
  ServerEventType type;
  string serverId;
  ServerStatus status = ServerStatus::STOPPED;
  vector<ToolDescriptor> tools;
  vector<ResourceDescriptor> resources;
  vector<PromptDescriptor> prompts;
  string error;

  static ServerEvent statusChanged(const string& serverId,
                                   ServerStatus status);
  static ServerEvent toolsUpdated(const string& serverId,
                                  const vector<ToolDescriptor>& tools);
  static ServerEvent resourcesUpdated(
      const string& serverId, const vector<ResourceDescriptor>& resources);
  static ServerEvent promptsUpdated(const string& serverId,
                                    const vector<PromptDescriptor>& prompts);
  static ServerEvent errorRaised(const string& serverId, const string& error);
};

/**
 * @brief A payload did not have the shape its method requires.
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const string& what) : std::runtime_error(what) {}
};

// Decoders for per-method results.  They throw ProtocolError or
// nlohmann::json::exception when the payload does not have the expected
// shape.

/** @brief Reads `capabilities` out of an initialize result. */
ServerCapabilities parseInitializeResult(const json& result);

/** @brief Reads `tools` out of a tools/list result. */
vector<ToolDescriptor> parseToolList(const json& result);

vector<ResourceDescriptor> parseResourceList(const json& result);

vector<PromptDescriptor> parsePromptList(const json& result);

ToolCallResult parseToolCallResult(const json& result);

vector<ResourceContent> parseResourceContents(const json& result);

vector<PromptMessage> parsePromptMessages(const json& result);

void from_json(const json& j, ToolDescriptor& tool);
void to_json(json& j, const ToolDescriptor& tool);
void from_json(const json& j, ResourceDescriptor& resource);
void from_json(const json& j, PromptArgument& argument);
void from_json(const json& j, PromptDescriptor& prompt);
void from_json(const json& j, ContentItem& item);
void to_json(json& j, const ContentItem& item);
void from_json(const json& j, ResourceContent& content);
void from_json(const json& j, PromptMessage& message);
}  // namespace mcpv

#endif  // __MCPV_MCP_TYPES__
