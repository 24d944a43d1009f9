#ifndef __MCPV_MESSAGE_FRAMER__
#define __MCPV_MESSAGE_FRAMER__

#include "Headers.hpp"

namespace mcpv {
/**
 * @brief Incrementally splits a byte stream into newline-terminated lines.
 *
 * Bytes after the last newline are retained until a later chunk completes
 * them. Lines are returned without their terminating newline.
 */
class MessageFramer {
 public:
  MessageFramer() {}

  /**
   * @brief Appends a chunk and returns every line it completed, in order.
   */
  vector<string> append(const string& chunk);

  /** @brief Returns true if an unterminated fragment is buffered. */
  bool hasPartial() const { return !buffer.empty(); }

  /** @brief Returns the unterminated fragment. */
  const string& getPartial() const { return buffer; }

  /**
   * @brief End of stream: hands out the unterminated fragment, if any, as
   * the last line.
   */
  optional<string> flush();

  /** @brief Drops any buffered fragment. */
  void clear() { buffer.clear(); }

 protected:
  string buffer;
};
}  // namespace mcpv

#endif  // __MCPV_MESSAGE_FRAMER__
