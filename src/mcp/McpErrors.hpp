#ifndef __MCPV_MCP_ERRORS__
#define __MCPV_MCP_ERRORS__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Subprocess.hpp"

namespace mcpv {
/**
 * @brief The initialize / listing exchange failed or returned malformed data.
 */
class HandshakeError : public std::runtime_error {
 public:
  explicit HandshakeError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief A well-formed JSON-RPC error response to one request.
 */
class RpcError : public std::runtime_error {
 public:
  RpcError(int _code, const string& message, const json& _data = json())
      : std::runtime_error(message), code(_code), data(_data) {}

  int getCode() const { return code; }
  const json& getData() const { return data; }

 protected:
  int code;
  json data;
};

/**
 * @brief No response arrived within the request timeout.
 */
class RequestTimeoutError : public std::runtime_error {
 public:
  explicit RequestTimeoutError(const string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief The owning instance was torn down while the request was pending.
 */
class ServerTerminatedError : public std::runtime_error {
 public:
  ServerTerminatedError(const string& what, bool _crashed)
      : std::runtime_error(what), crashed(_crashed) {}

  /** @brief true for "server crashed", false for "server stopped". */
  bool wasCrash() const { return crashed; }

 protected:
  bool crashed;
};

/**
 * @brief An operation that needs a `ready` instance was attempted in another
 * state.
 */
class ServerNotReadyError : public std::runtime_error {
 public:
  explicit ServerNotReadyError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The supervisor has no instance registered under the id.
 */
class ServerNotFoundError : public std::runtime_error {
 public:
  explicit ServerNotFoundError(const string& serverId)
      : std::runtime_error(string("Server not found: ") + serverId) {}
};

/**
 * @brief A configuration file or section could not be turned into a
 * `ServerConfig`.
 */
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const string& what) : std::runtime_error(what) {}
};
}  // namespace mcpv

#endif  // __MCPV_MCP_ERRORS__
