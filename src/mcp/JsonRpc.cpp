#include "JsonRpc.hpp"

namespace mcpv {
JsonRpcMessage JsonRpc::parse(const string& line) {
  json document = json::parse(line);
  if (!document.is_object()) {
    throw std::runtime_error(string("JSON-RPC message must be an object, got ") +
                             document.type_name());
  }

  JsonRpcMessage message;
  auto method = document.find("method");
  if (method != document.end()) {
    if (!method->is_string()) {
      throw std::runtime_error("JSON-RPC method must be a string");
    }
    message.method = method->get<string>();
  }
  auto params = document.find("params");
  if (params != document.end()) {
    message.params = *params;
  }

  auto id = document.find("id");
  if (id == document.end() || id->is_null()) {
    if (message.method.empty()) {
      throw std::runtime_error("JSON-RPC notification without a method");
    }
    message.kind = MessageKind::NOTIFICATION;
    return message;
  }
  if (!id->is_number_integer() && !id->is_string()) {
    throw std::runtime_error("JSON-RPC id must be an integer or a string");
  }
  message.id = *id;

  if (method != document.end()) {
    message.kind = MessageKind::REQUEST;
    return message;
  }

  message.kind = MessageKind::RESPONSE;
  auto error = document.find("error");
  if (error != document.end() && !error->is_null()) {
    if (!error->is_object()) {
      throw std::runtime_error("JSON-RPC error must be an object");
    }
    JsonRpcError rpcError;
    auto code = error->find("code");
    if (code != error->end() && code->is_number_integer()) {
      rpcError.code = code->get<int>();
    }
    auto errorMessage = error->find("message");
    if (errorMessage != error->end() && errorMessage->is_string()) {
      rpcError.message = errorMessage->get<string>();
    } else {
      rpcError.message = "Unknown JSON-RPC error";
    }
    auto data = error->find("data");
    if (data != error->end()) {
      rpcError.data = *data;
    }
    message.error = rpcError;
    return message;
  }
  auto result = document.find("result");
  if (result != document.end()) {
    message.result = *result;
  }
  return message;
}

string JsonRpc::encodeRequest(int64_t id, const string& method,
                              const json& params) {
  json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
  if (!params.is_null()) {
    request["params"] = params;
  }
  return request.dump() + "\n";
}

string JsonRpc::encodeNotification(const string& method, const json& params) {
  json notification = {{"jsonrpc", "2.0"}, {"method", method}};
  if (!params.is_null()) {
    notification["params"] = params;
  }
  return notification.dump() + "\n";
}

string JsonRpc::encodeResult(const json& id, const json& result) {
  json response = {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
  return response.dump() + "\n";
}

string JsonRpc::encodeError(const json& id, int code, const string& message) {
  json response = {{"jsonrpc", "2.0"},
                   {"id", id},
                   {"error", {{"code", code}, {"message", message}}}};
  return response.dump() + "\n";
}

optional<int64_t> JsonRpc::numericId(const json& id) {
  if (id.is_number_integer()) {
    return id.get<int64_t>();
  }
  if (id.is_string()) {
    const string& s = id.get_ref<const string&>();
    if (s.empty() || s.length() > 18 ||
        s.find_first_not_of("0123456789") != string::npos) {
      return std::nullopt;
    }
    return std::stoll(s);
  }
  return std::nullopt;
}
}  // namespace mcpv
