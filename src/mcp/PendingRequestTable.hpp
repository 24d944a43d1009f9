#ifndef __MCPV_PENDING_REQUEST_TABLE__
#define __MCPV_PENDING_REQUEST_TABLE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "JsonRpc.hpp"

namespace mcpv {
/**
 * @brief Correlates outgoing request ids with their eventual completion.
 *
 * Each entry owns a promise; a separate deadline index plays the role of the
 * timer registry. Exactly one of resolve/reject/expire/rejectAll completes an
 * entry: whichever removes it from the table first.
 */
class PendingRequestTable {
 public:
  typedef std::chrono::steady_clock Clock;

  PendingRequestTable() : lastId(0) {}

  /** @brief Hands out the next request id, starting at 1. */
  int64_t nextId();

  /**
   * @brief Restarts the id sequence at 1. Only valid while the table is
   * empty (between subprocess lifetimes).
   */
  void resetIds();

  /**
   * @brief Registers a request and returns the future its caller waits on.
   */
  std::future<json> add(int64_t id, const string& method,
                        Clock::time_point deadline);

  /**
   * @brief Completes the entry with a result.
   * @return false if no entry with that id exists (late or unknown response).
   */
  bool resolve(int64_t id, const json& result);

  /**
   * @brief Completes the entry with a JSON-RPC error (surfaced as `RpcError`).
   * @return false if no entry with that id exists.
   */
  bool reject(int64_t id, const JsonRpcError& error);

  /**
   * @brief Completes the entry with an arbitrary exception.
   * @return false if no entry with that id exists.
   */
  bool fail(int64_t id, std::exception_ptr error);

  /**
   * @brief Rejects every entry whose deadline is at or before `now` with a
   * `RequestTimeoutError`.
   * @return The number of entries that timed out.
   */
  int expire(Clock::time_point now);

  /**
   * @brief Rejects every entry with a `ServerTerminatedError` and clears
   * both the entries and the deadlines in one pass.
   * @return The number of entries that were rejected.
   */
  int rejectAll(const string& reason, bool crashed);

  size_t size() const;

  bool contains(int64_t id) const;

 protected:
  struct Entry {
    string method;
    std::promise<json> promise;
    multimap<Clock::time_point, int64_t>::iterator deadline;
  };

  /** @brief Removes an entry and its deadline; caller holds the lock. */
  bool take(int64_t id, Entry* entry);

  mutable std::mutex tableMutex;
  int64_t lastId;
  map<int64_t, Entry> entries;
  multimap<Clock::time_point, int64_t> deadlines;
};
}  // namespace mcpv

#endif  // __MCPV_PENDING_REQUEST_TABLE__
