#ifndef __RELAY_CLIENT_SESSION__
#define __RELAY_CLIENT_SESSION__

#include "SocketHandler.hpp"

namespace relay {
/**
 * @brief One accepted connection: its descriptor, identity and auth state.
 *
 * The owning worker is the only reader and the only caller of close(). Any
 * thread may send() or interrupt(); sends are serialized by a per-session
 * write lock and never touch the descriptor once close() has begun.
 */
class ClientSession {
 public:
  ClientSession(shared_ptr<SocketHandler> _socketHandler, int _fd, int64_t _id);
  virtual ~ClientSession();

  int64_t getId() const { return id; }
  int getFd() const { return fd; }
  /** @brief Name used for the worker thread and log lines, e.g. "conn-7". */
  string getName() const { return string("conn-") + to_string(id); }

  optional<string> getUsername();
  void setUsername(const string& username);

  AuthState getState();
  void setState(AuthState state);

  /**
   * @brief Writes one frame.
   * @throws std::runtime_error when the session is closed or the write fails.
   */
  void send(const string& payload);

  /**
   * @brief Blocks until one frame arrives.
   * @throws std::runtime_error when the peer closes or the session is
   * interrupted.
   */
  string receive();

  /**
   * @brief Holds the write lock so that several sends (and the work that
   * decides them) go out before any other thread's send.
   */
  std::unique_lock<std::recursive_mutex> lockWrites();

  /** @brief Unblocks the worker's pending read without closing the fd. */
  void interrupt();

  /** @brief Releases the descriptor. Safe to call more than once. */
  void close();

  bool isClosed() const { return closed; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int fd;
  int64_t id;

  std::mutex stateMutex;
  optional<string> username;
  AuthState state;

  std::recursive_mutex writeMutex;
  std::mutex closeMutex;
  std::atomic<bool> closed;
};
}  // namespace relay

#endif  // __RELAY_CLIENT_SESSION__
