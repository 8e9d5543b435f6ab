#include "ClientSession.hpp"

namespace relay {
ClientSession::ClientSession(shared_ptr<SocketHandler> _socketHandler,
                             int _fd, int64_t _id)
    : socketHandler(_socketHandler),
      fd(_fd),
      id(_id),
      state(CONNECTED),
      closed(false) {}

ClientSession::~ClientSession() {
  if (!closed) {
    LOG(WARNING) << getName() << " destroyed without being closed";
    close();
  }
}

optional<string> ClientSession::getUsername() {
  lock_guard<std::mutex> guard(stateMutex);
  return username;
}

void ClientSession::setUsername(const string& _username) {
  lock_guard<std::mutex> guard(stateMutex);
  username = _username;
}

AuthState ClientSession::getState() {
  lock_guard<std::mutex> guard(stateMutex);
  return state;
}

void ClientSession::setState(AuthState _state) {
  lock_guard<std::mutex> guard(stateMutex);
  state = _state;
}

void ClientSession::send(const string& payload) {
  lock_guard<std::recursive_mutex> guard(writeMutex);
  if (closed) {
    throw std::runtime_error("Tried to send on a closed session");
  }
  socketHandler->writeFrame(fd, payload);
}

string ClientSession::receive() {
  if (closed) {
    throw std::runtime_error("Tried to receive on a closed session");
  }
  return socketHandler->readFrame(fd, false);
}

std::unique_lock<std::recursive_mutex> ClientSession::lockWrites() {
  return std::unique_lock<std::recursive_mutex>(writeMutex);
}

void ClientSession::interrupt() {
  lock_guard<std::mutex> guard(closeMutex);
  if (closed) {
    return;
  }
  socketHandler->interrupt(fd);
}

void ClientSession::close() {
  {
    lock_guard<std::mutex> guard(closeMutex);
    if (closed) {
      return;
    }
    closed = true;
    // Kick any sender that is blocked on this fd so it drops the write lock.
    socketHandler->interrupt(fd);
  }
  lock_guard<std::recursive_mutex> guard(writeMutex);
  socketHandler->close(fd);
}
}  // namespace relay
