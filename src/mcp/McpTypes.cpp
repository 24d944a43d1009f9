#include "McpTypes.hpp"

namespace mcpv {
namespace {
string stringOr(const json& j, const char* key, const string& fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<string>();
}

optional<string> optionalString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<string>();
}

// A capability is advertised when its key is present and not false/null,
// so both {"tools": true} and {"tools": {}} count.
bool isAdvertised(const json& capabilities, const char* key) {
  auto it = capabilities.find(key);
  if (it == capabilities.end() || it->is_null()) {
    return false;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  return true;
}

bool subFlag(const json& capabilities, const char* key, const char* flag) {
  auto it = capabilities.find(key);
  if (it == capabilities.end() || !it->is_object()) {
    return false;
  }
  auto flagIt = it->find(flag);
  return flagIt != it->end() && flagIt->is_boolean() && flagIt->get<bool>();
}

template <typename T>
vector<T> listField(const json& result, const char* key) {
  if (!result.is_object()) {
    throw ProtocolError(string("result must be an object, got ") +
                        result.type_name());
  }
  auto it = result.find(key);
  if (it == result.end() || it->is_null()) {
    return vector<T>();
  }
  return it->get<vector<T>>();
}
}  // namespace

string serverStatusToString(ServerStatus status) {
  switch (status) {
    case ServerStatus::STOPPED:
      return "stopped";
    case ServerStatus::STARTING:
      return "starting";
    case ServerStatus::INITIALIZING:
      return "initializing";
    case ServerStatus::READY:
      return "ready";
    case ServerStatus::STOPPING:
      return "stopping";
    case ServerStatus::ERROR:
      return "error";
  }
  return "unknown";
}

ServerEvent ServerEvent::statusChanged(const string& serverId,
                                       ServerStatus status) {
  ServerEvent event;
  event.type = ServerEventType::STATUS_CHANGED;
  event.serverId = serverId;
  event.status = status;
  return event;
}

ServerEvent ServerEvent::toolsUpdated(const string& serverId,
                                      const vector<ToolDescriptor>& tools) {
  ServerEvent event;
  event.type = ServerEventType::TOOLS_UPDATED;
  event.serverId = serverId;
  event.tools = tools;
  return event;
}

ServerEvent ServerEvent::resourcesUpdated(
    const string& serverId, const vector<ResourceDescriptor>& resources) {
  ServerEvent event;
  event.type = ServerEventType::RESOURCES_UPDATED;
  event.serverId = serverId;
  event.resources = resources;
  return event;
}

ServerEvent ServerEvent::promptsUpdated(
    const string& serverId, const vector<PromptDescriptor>& prompts) {
  ServerEvent event;
  event.type = ServerEventType::PROMPTS_UPDATED;
  event.serverId = serverId;
  event.prompts = prompts;
  return event;
}

ServerEvent ServerEvent::errorRaised(const string& serverId,
                                     const string& error) {
  ServerEvent event;
  event.type = ServerEventType::ERROR;
  event.serverId = serverId;
  event.error = error;
  return event;
}

ServerCapabilities parseInitializeResult(const json& result) {
  if (!result.is_object()) {
    throw ProtocolError(string("initialize result must be an object, got ") +
                        result.type_name());
  }
  ServerCapabilities caps;
  auto it = result.find("capabilities");
  if (it == result.end() || it->is_null()) {
    return caps;
  }
  const json& capabilities = *it;
  if (!capabilities.is_object()) {
    throw ProtocolError(string("capabilities must be an object, got ") +
                        capabilities.type_name());
  }
  caps.tools = isAdvertised(capabilities, "tools");
  caps.toolsListChanged = subFlag(capabilities, "tools", "listChanged");
  caps.resources = isAdvertised(capabilities, "resources");
  caps.resourcesSubscribe = subFlag(capabilities, "resources", "subscribe");
  caps.resourcesListChanged =
      subFlag(capabilities, "resources", "listChanged");
  caps.prompts = isAdvertised(capabilities, "prompts");
  caps.promptsListChanged = subFlag(capabilities, "prompts", "listChanged");
  caps.logging = isAdvertised(capabilities, "logging");
  return caps;
}

vector<ToolDescriptor> parseToolList(const json& result) {
  return listField<ToolDescriptor>(result, "tools");
}

vector<ResourceDescriptor> parseResourceList(const json& result) {
  return listField<ResourceDescriptor>(result, "resources");
}

vector<PromptDescriptor> parsePromptList(const json& result) {
  return listField<PromptDescriptor>(result, "prompts");
}

ToolCallResult parseToolCallResult(const json& result) {
  ToolCallResult toolResult;
  toolResult.content = listField<ContentItem>(result, "content");
  auto isError = result.find("isError");
  if (isError != result.end() && !isError->is_null()) {
    toolResult.isError = isError->get<bool>();
  }
  auto structured = result.find("structuredContent");
  if (structured != result.end()) {
    toolResult.structuredContent = *structured;
  }
  return toolResult;
}

vector<ResourceContent> parseResourceContents(const json& result) {
  return listField<ResourceContent>(result, "contents");
}

vector<PromptMessage> parsePromptMessages(const json& result) {
  return listField<PromptMessage>(result, "messages");
}

void from_json(const json& j, ToolDescriptor& tool) {
  tool.name = j.at("name").get<string>();
  tool.description = stringOr(j, "description", "");
  auto schema = j.find("inputSchema");
  if (schema != j.end() && !schema->is_null()) {
    tool.inputSchema = *schema;
  } else {
    tool.inputSchema = {{"type", "object"}};
  }
}

void to_json(json& j, const ToolDescriptor& tool) {
  j = json{{"name", tool.name},
           {"description", tool.description},
           {"inputSchema", tool.inputSchema}};
}

void from_json(const json& j, ResourceDescriptor& resource) {
  resource.uri = j.at("uri").get<string>();
  resource.name = stringOr(j, "name", resource.uri);
  resource.description = stringOr(j, "description", "");
  resource.mimeType = stringOr(j, "mimeType", "");
}

void from_json(const json& j, PromptArgument& argument) {
  argument.name = j.at("name").get<string>();
  argument.description = stringOr(j, "description", "");
  auto required = j.find("required");
  argument.required = required != j.end() && required->is_boolean() &&
                      required->get<bool>();
}

void from_json(const json& j, PromptDescriptor& prompt) {
  prompt.name = j.at("name").get<string>();
  prompt.description = stringOr(j, "description", "");
  auto arguments = j.find("arguments");
  if (arguments != j.end() && !arguments->is_null()) {
    prompt.arguments = arguments->get<vector<PromptArgument>>();
  }
}

void from_json(const json& j, ContentItem& item) {
  item.type = stringOr(j, "type", "text");
  item.mimeType = optionalString(j, "mimeType");
  if (item.type == "text") {
    item.text = optionalString(j, "text");
  } else if (item.type == "image" || item.type == "audio") {
    item.data = optionalString(j, "data");
  } else if (item.type == "resource") {
    auto resource = j.find("resource");
    if (resource != j.end()) {
      item.resource = *resource;
    }
  } else {
    item.resource = j;
  }
}

void to_json(json& j, const ContentItem& item) {
  j = json{{"type", item.type}};
  if (item.text) {
    j["text"] = *item.text;
  }
  if (item.data) {
    j["data"] = *item.data;
  }
  if (item.mimeType) {
    j["mimeType"] = *item.mimeType;
  }
  if (!item.resource.is_null()) {
    j["resource"] = item.resource;
  }
}

void from_json(const json& j, ResourceContent& content) {
  content.uri = j.at("uri").get<string>();
  content.mimeType = stringOr(j, "mimeType", "");
  content.text = optionalString(j, "text");
  content.blob = optionalString(j, "blob");
}

void from_json(const json& j, PromptMessage& message) {
  message.role = j.at("role").get<string>();
  message.content = j.at("content").get<ContentItem>();
}
}  // namespace mcpv
