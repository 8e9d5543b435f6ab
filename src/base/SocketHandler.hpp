#ifndef __RELAY_SOCKET_HANDLER__
#define __RELAY_SOCKET_HANDLER__

#include "Headers.hpp"

namespace relay {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when data is ready to read on a descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, blocking until the buffer fills.
   * @param timeout Whether to give up after SOCKET_DATA_TRANSFER_TIMEOUT
   * seconds without progress.
   * @throws std::runtime_error when the peer closes or the read fails.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads one length-prefixed frame.
   * @throws std::runtime_error on a transport error or an invalid length.
   */
  string readFrame(int fd, bool timeout);

  /**
   * @brief Writes @p payload as one length-prefixed frame.
   * @throws std::runtime_error on a transport error.
   */
  void writeFrame(int fd, const string& payload);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Returns the listening fds associated with the endpoint.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   * @return The new descriptor, or -1 when nothing was pending.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Unblocks pending reads and writes on fd without releasing it.
   *
   * The owner still has to call close() once it has noticed the failure.
   */
  virtual void interrupt(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace relay

#endif  // __RELAY_SOCKET_HANDLER__
