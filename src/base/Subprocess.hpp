#ifndef __MCPV_SUBPROCESS__
#define __MCPV_SUBPROCESS__

#include "Headers.hpp"

namespace mcpv {
/**
 * @brief Raised when a child process could not be launched (missing binary,
 * permission denied, resource exhaustion).
 */
class SpawnError : public std::runtime_error {
 public:
  explicit SpawnError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The child did not take a whole message off its stdin in time.
 */
class WriteTimeoutError : public std::runtime_error {
 public:
  WriteTimeoutError(const string& what, size_t _bytesWritten)
      : std::runtime_error(what), bytesWritten(_bytesWritten) {}

  /** @brief Non-zero means the child's input now holds a torn message. */
  size_t getBytesWritten() const { return bytesWritten; }

 protected:
  size_t bytesWritten;
};

/**
 * @brief A child process whose stdin, stdout and stderr are connected to
 * pipes owned by this object.
 *
 * The stdout/stderr descriptors are non-blocking and are meant to be read by
 * a single reader thread; `closeOutputs()` must only be called by that thread
 * or after it has been joined. Writes to stdin and process-state queries are
 * thread-safe, and a writer stuck on a full pipe never blocks `poll()` or
 * `sendSignal()`.
 */
class Subprocess {
 public:
  /**
   * @brief Forks and execs `command` (looked up on PATH) with `args`, the
   * parent environment and `envOverrides` applied on top.
   * @throws SpawnError if the pipes cannot be created, the fork fails or the
   * exec fails in the child.
   */
  static shared_ptr<Subprocess> spawn(const string& command,
                                      const vector<string>& args,
                                      const map<string, string>& envOverrides);

  /** @brief Kills (SIGKILL) and reaps the child if it is still alive. */
  virtual ~Subprocess();

  pid_t getPid() const { return pid; }
  int getStdoutFd() const { return stdoutFd; }
  int getStderrFd() const { return stderrFd; }

  /**
   * @brief Writes all of `data` to the child's stdin, giving up at
   * `deadline` if the child stops reading.
   * @throws WriteTimeoutError if the deadline passed first.
   * @throws std::runtime_error if stdin was closed (also while waiting) or
   * the pipe is broken.
   */
  void write(const string& data,
             std::chrono::steady_clock::time_point deadline);

  /**
   * @brief Closes our end of the child's stdin. A write blocked on a full
   * pipe is abandoned first.
   */
  void closeStdin();

  /** @brief Closes our ends of the child's stdout and stderr. */
  void closeOutputs();

  /**
   * @brief Reaps the child without blocking.
   * @return true once the child has exited.
   */
  bool poll();

  /**
   * @brief Polls until the child exits or `timeout` elapses.
   * @return true if the child exited in time.
   */
  bool waitForExit(std::chrono::milliseconds timeout);

  /** @brief Sends `signum` to the child unless it has already been reaped. */
  void sendSignal(int signum);

  /** @brief Human readable exit reason ("exited with code 1"). */
  string describeExit() const;

 protected:
  Subprocess(pid_t _pid, int _stdinFd, int _stdoutFd, int _stderrFd);

  /** @brief Child process id. */
  pid_t pid;
  /** @brief Write end of the child's stdin, -1 once closed. */
  int stdinFd;
  /** @brief Read end of the child's stdout, -1 once closed. */
  int stdoutFd;
  /** @brief Read end of the child's stderr, -1 once closed. */
  int stderrFd;
  /** @brief Set once waitpid has reaped the child. */
  bool exited;
  /** @brief Raw waitpid status, valid when `exited` is set. */
  int exitStatus;
  /** @brief Guards the reaped state. */
  mutable recursive_mutex processMutex;
  /** @brief Serializes writers and guards `stdinFd`. */
  std::timed_mutex writeMutex;
  /** @brief Set by closeStdin() to cut a pending write short. */
  std::atomic<bool> stdinClosing;
};
}  // namespace mcpv

#endif  // __MCPV_SUBPROCESS__
