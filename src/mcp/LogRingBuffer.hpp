#ifndef __MCPV_LOG_RING_BUFFER__
#define __MCPV_LOG_RING_BUFFER__

#include "Headers.hpp"

namespace mcpv {
/**
 * @brief One timestamped line of diagnostic text from a tool server.
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  string message;

  /** @brief "[2024-01-01T00:00:00.000Z] message" */
  string toString() const;
};

/**
 * @brief Thread-safe bounded FIFO of log entries; the oldest entry is evicted
 * once capacity is exceeded.
 */
class LogRingBuffer {
 public:
  explicit LogRingBuffer(size_t _capacity = MAX_SERVER_LOG_ENTRIES);

  /** @brief Appends a message stamped with the current time. */
  void add(const string& message);

  void add(const LogEntry& entry);

  /** @brief Returns a copy of the buffered entries, oldest first. */
  vector<LogEntry> snapshot() const;

  void clear();

  size_t size() const;

  size_t getCapacity() const { return capacity; }

 protected:
  size_t capacity;
  deque<LogEntry> entries;
  mutable std::mutex bufferMutex;
};
}  // namespace mcpv

#endif  // __MCPV_LOG_RING_BUFFER__
