#ifndef __RELAY_CLIENT_REGISTRY__
#define __RELAY_CLIENT_REGISTRY__

#include "ClientSession.hpp"

namespace relay {
/**
 * @brief The set of authenticated, live sessions and their usernames.
 *
 * Every operation runs under a single lock. Usernames are unique among live
 * entries; a name becomes available again once its entry is removed.
 */
class ClientRegistry {
 public:
  struct Entry {
    shared_ptr<ClientSession> session;
    string username;
  };

  /**
   * @brief Adds @p session under @p username.
   * @return false if another live session already holds the username, or the
   * session is already registered.
   */
  bool registerSession(shared_ptr<ClientSession> session,
                       const string& username);

  /**
   * @brief Removes the session's entry if present.
   * @return true if an entry was removed.
   */
  bool deregisterSession(const shared_ptr<ClientSession>& session);

  /**
   * @brief Copy of all live entries in registration order.
   */
  vector<Entry> snapshot();

  bool isOnline(const string& username);
  size_t size();

 protected:
  std::mutex registryMutex;
  // Keyed by session id, which grows with accept order.
  map<int64_t, Entry> entries;
  unordered_map<string, int64_t> usernames;
};
}  // namespace relay

#endif  // __RELAY_CLIENT_REGISTRY__
