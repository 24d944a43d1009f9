#ifndef __MCPV_JSON_RPC__
#define __MCPV_JSON_RPC__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace mcpv {
// Standard JSON-RPC 2.0 error codes
const int JSONRPC_PARSE_ERROR = -32700;
const int JSONRPC_INVALID_REQUEST = -32600;
const int JSONRPC_METHOD_NOT_FOUND = -32601;
const int JSONRPC_INVALID_PARAMS = -32602;
const int JSONRPC_INTERNAL_ERROR = -32603;

/**
 * @brief The three JSON-RPC message shapes.
 */
enum class MessageKind {
  REQUEST,
  RESPONSE,
  NOTIFICATION,
};

struct JsonRpcError {
  int code = JSONRPC_INTERNAL_ERROR;
  string message;
  json data;
};

/**
 * @brief One decoded JSON-RPC 2.0 document.
 *
 * Presence of `id` separates responses (and server requests) from
 * notifications; a document with an id and a method is a request, one with
 * an id and no method is a response.
 */
struct JsonRpcMessage {
  MessageKind kind = MessageKind::NOTIFICATION;
  /** @brief Number or string; null for notifications. */
  json id;
  /** @brief Set for requests and notifications. */
  string method;
  json params;
  /** @brief Set for successful responses. */
  json result;
  /** @brief Set for failed responses. */
  optional<JsonRpcError> error;
};

/**
 * @brief Encodes and decodes newline-delimited JSON-RPC 2.0 documents.
 */
class JsonRpc {
 public:
  /**
   * @brief Parses and classifies one line.
   * @throws nlohmann::json::parse_error if the line is not JSON.
   * @throws std::runtime_error if it is JSON but not a JSON-RPC message.
   */
  static JsonRpcMessage parse(const string& line);

  /** @brief Encodes a request, including the trailing newline. */
  static string encodeRequest(int64_t id, const string& method,
                              const json& params);

  /** @brief Encodes a notification, including the trailing newline. */
  static string encodeNotification(const string& method, const json& params);

  /** @brief Encodes a success response, including the trailing newline. */
  static string encodeResult(const json& id, const json& result);

  /** @brief Encodes an error response, including the trailing newline. */
  static string encodeError(const json& id, int code, const string& message);

  /**
   * @brief Returns the id as an integer, accepting decimal strings.
   * @return nullopt for ids that cannot have been issued by us.
   */
  static optional<int64_t> numericId(const json& id);
};
}  // namespace mcpv

#endif  // __MCPV_JSON_RPC__
