#ifndef __RELAY_RELAY_CLIENT__
#define __RELAY_RELAY_CLIENT__

#include "MessageCodec.hpp"
#include "SocketHandler.hpp"
#include "WireTokens.hpp"

namespace relay {
/**
 * @brief Client side of the relay protocol.
 */
class RelayClient {
 public:
  /**
   * @brief Connects to @p endpoint.
   * @throws std::runtime_error when the connection cannot be made.
   */
  RelayClient(shared_ptr<SocketHandler> _socketHandler,
              const SocketEndpoint& endpoint,
              shared_ptr<MessageCodec> _codec);

  /**
   * @brief Takes ownership of an already connected, tracked descriptor.
   */
  RelayClient(shared_ptr<SocketHandler> _socketHandler, int _fd,
              shared_ptr<MessageCodec> _codec);

  virtual ~RelayClient();

  /**
   * @brief Runs the LOGIN/REGISTER exchange.
   * @return true on AUTH_SUCCESS, false if the server answered anything else.
   */
  bool authenticate(AuthChoice choice, const string& username,
                    const string& password);

  /** @brief Reads one plaintext protocol token. */
  string readToken();
  void sendToken(const string& token);

  void sendChat(const string& text);

  /**
   * @brief Waits up to @p timeoutMs for the next chat line and decodes it.
   * @throws DecodeError if the envelope does not open with our key.
   */
  optional<string> receive(int timeoutMs);

  /** @brief Asks the server to end the session. */
  void quit();

  void close();
  bool isClosed() const { return fd < 0; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<MessageCodec> codec;
  int fd;
};
}  // namespace relay

#endif  // __RELAY_RELAY_CLIENT__
