#ifndef __MCPV_EVENT_CHANNEL__
#define __MCPV_EVENT_CHANNEL__

#include "Headers.hpp"

namespace mcpv {
/**
 * @brief A typed publish/subscribe channel.
 *
 * Listeners are invoked synchronously on the publishing thread, outside of
 * the channel's lock, so a listener may subscribe, unsubscribe or publish
 * again while being called.
 */
template <typename Event>
class EventChannel {
 public:
  typedef std::function<void(const Event&)> Listener;

  EventChannel() : nextToken(1) {}

  /**
   * @brief Registers a listener.
   * @return A token that can be passed to `unsubscribe()`.
   */
  int subscribe(Listener listener) {
    lock_guard<mutex> guard(listenerMutex);
    int token = nextToken++;
    listeners[token] = std::make_shared<Listener>(std::move(listener));
    return token;
  }

  /** @brief Removes a listener; unknown tokens are ignored. */
  void unsubscribe(int token) {
    lock_guard<mutex> guard(listenerMutex);
    listeners.erase(token);
  }

  /** @brief Removes every listener. */
  void clear() {
    lock_guard<mutex> guard(listenerMutex);
    listeners.clear();
  }

  size_t size() const {
    lock_guard<mutex> guard(listenerMutex);
    return listeners.size();
  }

  /** @brief Delivers `event` to every listener registered at call time. */
  void publish(const Event& event) const {
    vector<shared_ptr<Listener>> snapshot;
    {
      lock_guard<mutex> guard(listenerMutex);
      for (const auto& it : listeners) {
        snapshot.push_back(it.second);
      }
    }
    for (const auto& listener : snapshot) {
      (*listener)(event);
    }
  }

 protected:
  mutable mutex listenerMutex;
  int nextToken;
  map<int, shared_ptr<Listener>> listeners;
};
}  // namespace mcpv

#endif  // __MCPV_EVENT_CHANNEL__
