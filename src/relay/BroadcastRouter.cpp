#include "BroadcastRouter.hpp"

#include "WireTokens.hpp"

namespace relay {
BroadcastRouter::BroadcastRouter(shared_ptr<ClientRegistry> _registry,
                                 shared_ptr<MessageCodec> _codec)
    : registry(_registry), codec(_codec) {}

int BroadcastRouter::deliver(const string& line,
                             const shared_ptr<ClientSession>& exclude) {
  auto recipients = registry->snapshot();
  auto currentListeners = getListeners();
  int attempted = 0;
  for (const auto& entry : recipients) {
    if (exclude && entry.session->getId() == exclude->getId()) {
      continue;
    }
    attempted++;
    try {
      entry.session->send(codec->encode(line));
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Delivery to " << entry.username << " ("
                << entry.session->getName() << ") failed: " << re.what();
      registry->deregisterSession(entry.session);
      entry.session->interrupt();
      for (auto& listener : currentListeners) {
        listener->onDeliveryFailed(entry.session->getId(), entry.username,
                                   re.what());
      }
      continue;
    }
    for (auto& listener : currentListeners) {
      listener->onDelivered(entry.session->getId(), entry.username, line);
    }
  }
  VLOG(2) << "Delivered to " << attempted << " of " << recipients.size()
          << " sessions";
  return attempted;
}

int BroadcastRouter::deliver(const ChatMessage& message,
                             const shared_ptr<ClientSession>& exclude) {
  return deliver(formatChatLine(message), exclude);
}

void BroadcastRouter::addListener(shared_ptr<DeliveryListener> listener) {
  lock_guard<std::mutex> guard(listenerMutex);
  listeners.push_back(listener);
}

vector<shared_ptr<DeliveryListener>> BroadcastRouter::getListeners() {
  lock_guard<std::mutex> guard(listenerMutex);
  return listeners;
}
}  // namespace relay
