#include "McpTypes.hpp"

#include "TestHeaders.hpp"

using namespace mcpv;

TEST_CASE("Initialize result capabilities", "[McpTypes]") {
  SECTION("Object and boolean forms both count") {
    auto caps = parseInitializeResult(json::parse(R"({
      "protocolVersion": "2024-11-05",
      "capabilities": {"tools": {"listChanged": true}, "resources": true,
                       "prompts": false, "logging": {}}
    })"));
    REQUIRE(caps.tools);
    REQUIRE(caps.toolsListChanged);
    REQUIRE(caps.resources);
    REQUIRE_FALSE(caps.resourcesListChanged);
    REQUIRE_FALSE(caps.prompts);
    REQUIRE(caps.logging);
  }

  SECTION("Missing capabilities means nothing is supported") {
    auto caps = parseInitializeResult(json::object());
    REQUIRE_FALSE(caps.tools);
    REQUIRE_FALSE(caps.resources);
  }

  SECTION("Wrong shapes are protocol errors") {
    REQUIRE_THROWS_AS(parseInitializeResult(json("x")), ProtocolError);
    REQUIRE_THROWS_AS(parseInitializeResult(json{{"capabilities", 3}}),
                      ProtocolError);
  }
}

TEST_CASE("Tool list decoding", "[McpTypes]") {
  auto tools = parseToolList(json::parse(R"({"tools": [
    {"name": "echo", "description": "Echo back",
     "inputSchema": {"type": "object", "properties": {"text": {"type": "string"}}}},
    {"name": "bare"}
  ]})"));
  REQUIRE(tools.size() == 2);
  REQUIRE(tools[0].name == "echo");
  REQUIRE(tools[0].description == "Echo back");
  REQUIRE(tools[0].inputSchema["properties"].contains("text"));
  REQUIRE(tools[1].description.empty());
  REQUIRE(tools[1].inputSchema["type"] == "object");

  REQUIRE(parseToolList(json::object()).empty());
  REQUIRE_THROWS(parseToolList(json::parse(R"({"tools": [{"description": "no name"}]})")));
}

TEST_CASE("Tool call result decoding", "[McpTypes]") {
  auto result = parseToolCallResult(json::parse(R"({
    "content": [
      {"type": "text", "text": "hello"},
      {"type": "image", "data": "AAAA", "mimeType": "image/png"},
      {"type": "resource", "resource": {"uri": "file:///x", "text": "y"}}
    ],
    "isError": true
  })"));
  REQUIRE(result.isError);
  REQUIRE(result.content.size() == 3);
  REQUIRE(result.content[0].text == optional<string>("hello"));
  REQUIRE(result.content[1].data == optional<string>("AAAA"));
  REQUIRE(result.content[1].mimeType == optional<string>("image/png"));
  REQUIRE(result.content[2].resource["uri"] == "file:///x");
  REQUIRE(result.structuredContent.is_null());

  json encoded = result.content[0];
  REQUIRE(encoded == json::parse(R"({"type": "text", "text": "hello"})"));
}

TEST_CASE("Resource and prompt decoding", "[McpTypes]") {
  auto resources = parseResourceList(json::parse(
      R"({"resources": [{"uri": "mem://a", "mimeType": "text/plain"}]})"));
  REQUIRE(resources.size() == 1);
  REQUIRE(resources[0].name == "mem://a");
  REQUIRE(resources[0].mimeType == "text/plain");

  auto contents = parseResourceContents(
      json::parse(R"({"contents": [{"uri": "mem://a", "text": "abc"}]})"));
  REQUIRE(contents[0].text == optional<string>("abc"));
  REQUIRE_FALSE(contents[0].blob);

  auto prompts = parsePromptList(json::parse(R"({"prompts": [
    {"name": "greet", "arguments": [{"name": "who", "required": true}]}
  ]})"));
  REQUIRE(prompts[0].arguments.size() == 1);
  REQUIRE(prompts[0].arguments[0].required);

  auto messages = parsePromptMessages(json::parse(R"({"messages": [
    {"role": "user", "content": {"type": "text", "text": "hi"}}
  ]})"));
  REQUIRE(messages[0].role == "user");
  REQUIRE(messages[0].content.text == optional<string>("hi"));
}

TEST_CASE("Server status names", "[McpTypes]") {
  REQUIRE(serverStatusToString(ServerStatus::READY) == "ready");
  REQUIRE(serverStatusToString(ServerStatus::INITIALIZING) == "initializing");
  REQUIRE(isIdleStatus(ServerStatus::STOPPED));
  REQUIRE(isIdleStatus(ServerStatus::ERROR));
  REQUIRE_FALSE(isIdleStatus(ServerStatus::STOPPING));
}
