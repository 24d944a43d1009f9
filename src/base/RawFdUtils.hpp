#ifndef __MCPV_RAW_FD_UTILS__
#define __MCPV_RAW_FD_UTILS__

#include "Headers.hpp"

namespace mcpv {
/**
 * @brief Blocking and non-blocking helpers around POSIX pipe descriptors.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes as much of the buffer to a non-blocking descriptor as the
   * reader accepts before `deadline`, retrying on EAGAIN and EINTR.
   *
   * Waits for writability in short slices and gives up early once `abort`
   * is set.
   * @return The number of bytes written; less than `count` on timeout or
   * abort.
   * @throws std::runtime_error when the descriptor is closed or broken.
   */
  static size_t writeUntil(int fd, const char* buf, size_t count,
                           std::chrono::steady_clock::time_point deadline,
                           const std::atomic<bool>* abort);

  /**
   * @brief Drains everything currently readable from a non-blocking
   * descriptor into `out`.
   * @return false once the writer side has closed (end of stream).
   * @throws std::runtime_error on a read error other than EAGAIN/EINTR.
   */
  static bool readAvailable(int fd, string* out);

  /** @brief Puts the descriptor into non-blocking mode. */
  static void setNonBlocking(int fd);

  /** @brief Marks the descriptor close-on-exec. */
  static void setCloseOnExec(int fd);
};
}  // namespace mcpv
#endif  // __MCPV_RAW_FD_UTILS__
