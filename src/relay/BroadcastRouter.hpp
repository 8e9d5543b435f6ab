#ifndef __RELAY_BROADCAST_ROUTER__
#define __RELAY_BROADCAST_ROUTER__

#include "ClientRegistry.hpp"
#include "MessageCodec.hpp"

namespace relay {
/**
 * @brief Observer for per-recipient delivery outcomes. Called on the thread
 * that invoked BroadcastRouter::deliver; implementations must not throw.
 */
class DeliveryListener {
 public:
  virtual ~DeliveryListener() {}

  virtual void onDelivered(int64_t recipientId,
                           const string& recipientUsername,
                           const string& line) = 0;

  virtual void onDeliveryFailed(int64_t recipientId,
                                const string& recipientUsername,
                                const string& reason) = 0;
};

/**
 * @brief Fans a line out to every registered session except the sender.
 */
class BroadcastRouter {
 public:
  BroadcastRouter(shared_ptr<ClientRegistry> _registry,
                  shared_ptr<MessageCodec> _codec);

  /**
   * @brief Encodes @p line separately for every registry member other than
   * @p exclude and sends it. A recipient whose send fails is removed from the
   * registry and interrupted; the remaining recipients are still served.
   * @param exclude May be null for server-originated lines.
   * @return Number of sends attempted.
   */
  int deliver(const string& line, const shared_ptr<ClientSession>& exclude);

  /** @brief Delivers `<sender>: <text>`. */
  int deliver(const ChatMessage& message,
              const shared_ptr<ClientSession>& exclude);

  void addListener(shared_ptr<DeliveryListener> listener);

 protected:
  shared_ptr<ClientRegistry> registry;
  shared_ptr<MessageCodec> codec;

  std::mutex listenerMutex;
  vector<shared_ptr<DeliveryListener>> listeners;

  vector<shared_ptr<DeliveryListener>> getListeners();
};
}  // namespace relay

#endif  // __RELAY_BROADCAST_ROUTER__
