#ifndef __RELAY_TCP_SOCKET_HANDLER__
#define __RELAY_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace relay {
/**
 * @brief Implements IPv4/IPv6 socket operations built on top of
 * UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects to the server. The
   * returned descriptor is tracked and non-blocking.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint's port. An endpoint name
   * restricts the bind to that address, otherwise all interfaces are used.
   * @throws std::runtime_error when the port cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the requested port and closes all related fds.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks all listening sockets created per TCP port. */
  map<int, set<int>> portServerSockets;

  /**
   * @brief Adds TCP_NODELAY on top of the base socket configuration.
   */
  virtual void initSocket(int fd);
};
}  // namespace relay

#endif  // __RELAY_TCP_SOCKET_HANDLER__
