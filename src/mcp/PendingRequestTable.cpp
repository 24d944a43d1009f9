#include "PendingRequestTable.hpp"

#include "McpErrors.hpp"

namespace mcpv {
int64_t PendingRequestTable::nextId() {
  lock_guard<std::mutex> guard(tableMutex);
  return ++lastId;
}

void PendingRequestTable::resetIds() {
  lock_guard<std::mutex> guard(tableMutex);
  if (!entries.empty()) {
    STFATAL << "Resetting request ids with " << entries.size()
            << " requests still pending";
  }
  lastId = 0;
}

std::future<json> PendingRequestTable::add(int64_t id, const string& method,
                                           Clock::time_point deadline) {
  lock_guard<std::mutex> guard(tableMutex);
  if (entries.find(id) != entries.end()) {
    STFATAL << "Duplicate request id " << id;
  }
  Entry& entry = entries[id];
  entry.method = method;
  entry.deadline = deadlines.insert(make_pair(deadline, id));
  return entry.promise.get_future();
}

bool PendingRequestTable::take(int64_t id, Entry* entry) {
  auto it = entries.find(id);
  if (it == entries.end()) {
    return false;
  }
  deadlines.erase(it->second.deadline);
  *entry = std::move(it->second);
  entries.erase(it);
  return true;
}

bool PendingRequestTable::resolve(int64_t id, const json& result) {
  Entry entry;
  {
    lock_guard<std::mutex> guard(tableMutex);
    if (!take(id, &entry)) {
      return false;
    }
  }
  entry.promise.set_value(result);
  return true;
}

bool PendingRequestTable::reject(int64_t id, const JsonRpcError& error) {
  return fail(id, std::make_exception_ptr(
                      RpcError(error.code, error.message, error.data)));
}

bool PendingRequestTable::fail(int64_t id, std::exception_ptr error) {
  Entry entry;
  {
    lock_guard<std::mutex> guard(tableMutex);
    if (!take(id, &entry)) {
      return false;
    }
  }
  entry.promise.set_exception(error);
  return true;
}

int PendingRequestTable::expire(Clock::time_point now) {
  vector<Entry> expired;
  {
    lock_guard<std::mutex> guard(tableMutex);
    while (!deadlines.empty() && deadlines.begin()->first <= now) {
      int64_t id = deadlines.begin()->second;
      Entry entry;
      if (!take(id, &entry)) {
        STFATAL << "Deadline without an entry for request " << id;
      }
      VLOG(1) << "Request " << id << " (" << entry.method << ") timed out";
      expired.push_back(std::move(entry));
    }
  }
  for (auto& entry : expired) {
    entry.promise.set_exception(std::make_exception_ptr(RequestTimeoutError(
        string("Request timed out: ") + entry.method)));
  }
  return int(expired.size());
}

int PendingRequestTable::rejectAll(const string& reason, bool crashed) {
  map<int64_t, Entry> drained;
  {
    lock_guard<std::mutex> guard(tableMutex);
    drained.swap(entries);
    deadlines.clear();
  }
  for (auto& it : drained) {
    it.second.promise.set_exception(
        std::make_exception_ptr(ServerTerminatedError(reason, crashed)));
  }
  return int(drained.size());
}

size_t PendingRequestTable::size() const {
  lock_guard<std::mutex> guard(tableMutex);
  return entries.size();
}

bool PendingRequestTable::contains(int64_t id) const {
  lock_guard<std::mutex> guard(tableMutex);
  return entries.find(id) != entries.end();
}
}  // namespace mcpv
