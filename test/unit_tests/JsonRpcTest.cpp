#include "JsonRpc.hpp"

#include "TestHeaders.hpp"

using namespace mcpv;

TEST_CASE("JsonRpc classifies messages", "[JsonRpc]") {
  SECTION("Response with result") {
    auto message =
        JsonRpc::parse(R"({"jsonrpc":"2.0","id":7,"result":{"ok":true}})");
    REQUIRE(message.kind == MessageKind::RESPONSE);
    REQUIRE(message.id == 7);
    REQUIRE(message.result["ok"] == true);
    REQUIRE_FALSE(message.error);
  }

  SECTION("Response with error") {
    auto message = JsonRpc::parse(
        R"({"jsonrpc":"2.0","id":"3","error":{"code":-32602,"message":"bad","data":{"x":1}}})");
    REQUIRE(message.kind == MessageKind::RESPONSE);
    REQUIRE(message.error);
    REQUIRE(message.error->code == JSONRPC_INVALID_PARAMS);
    REQUIRE(message.error->message == "bad");
    REQUIRE(message.error->data["x"] == 1);
  }

  SECTION("Notification") {
    auto message = JsonRpc::parse(
        R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    REQUIRE(message.kind == MessageKind::NOTIFICATION);
    REQUIRE(message.method == "notifications/tools/list_changed");
  }

  SECTION("Request from the server") {
    auto message =
        JsonRpc::parse(R"({"jsonrpc":"2.0","id":"p1","method":"ping"})");
    REQUIRE(message.kind == MessageKind::REQUEST);
    REQUIRE(message.method == "ping");
    REQUIRE(message.id == "p1");
  }
}

TEST_CASE("JsonRpc rejects malformed input", "[JsonRpc]") {
  REQUIRE_THROWS_AS(JsonRpc::parse("not json"), json::parse_error);
  REQUIRE_THROWS_AS(JsonRpc::parse("[1,2]"), std::runtime_error);
  REQUIRE_THROWS_AS(JsonRpc::parse(R"({"jsonrpc":"2.0"})"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(JsonRpc::parse(R"({"id":{},"result":1})"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(JsonRpc::parse(R"({"id":1,"method":5})"),
                    std::runtime_error);
}

TEST_CASE("JsonRpc encodes one document per line", "[JsonRpc]") {
  string request = JsonRpc::encodeRequest(4, "tools/call", {{"name", "x"}});
  REQUIRE(request.back() == '\n');
  REQUIRE(std::count(request.begin(), request.end(), '\n') == 1);
  json decoded = json::parse(request);
  REQUIRE(decoded["jsonrpc"] == "2.0");
  REQUIRE(decoded["id"] == 4);
  REQUIRE(decoded["method"] == "tools/call");
  REQUIRE(decoded["params"]["name"] == "x");

  json notification =
      json::parse(JsonRpc::encodeNotification("notifications/initialized",
                                              json()));
  REQUIRE_FALSE(notification.contains("id"));
  REQUIRE_FALSE(notification.contains("params"));

  json error = json::parse(
      JsonRpc::encodeError("abc", JSONRPC_METHOD_NOT_FOUND, "nope"));
  REQUIRE(error["id"] == "abc");
  REQUIRE(error["error"]["code"] == -32601);
}

TEST_CASE("JsonRpc numericId accepts decimal strings", "[JsonRpc]") {
  REQUIRE(JsonRpc::numericId(json(12)) == optional<int64_t>(12));
  REQUIRE(JsonRpc::numericId(json("12")) == optional<int64_t>(12));
  REQUIRE_FALSE(JsonRpc::numericId(json("x12")));
  REQUIRE_FALSE(JsonRpc::numericId(json("")));
  REQUIRE_FALSE(JsonRpc::numericId(json()));
}
