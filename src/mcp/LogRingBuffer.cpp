#include "LogRingBuffer.hpp"

namespace mcpv {
string LogEntry::toString() const {
  return string("[") + toIsoTimestamp(timestamp) + "] " + message;
}

LogRingBuffer::LogRingBuffer(size_t _capacity) : capacity(_capacity) {
  if (capacity == 0) {
    STFATAL << "Log buffer capacity must be positive";
  }
}

void LogRingBuffer::add(const string& message) {
  LogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.message = message;
  add(entry);
}

void LogRingBuffer::add(const LogEntry& entry) {
  lock_guard<std::mutex> guard(bufferMutex);
  entries.push_back(entry);
  while (entries.size() > capacity) {
    entries.pop_front();
  }
}

vector<LogEntry> LogRingBuffer::snapshot() const {
  lock_guard<std::mutex> guard(bufferMutex);
  return vector<LogEntry>(entries.begin(), entries.end());
}

void LogRingBuffer::clear() {
  lock_guard<std::mutex> guard(bufferMutex);
  entries.clear();
}

size_t LogRingBuffer::size() const {
  lock_guard<std::mutex> guard(bufferMutex);
  return entries.size();
}
}  // namespace mcpv
