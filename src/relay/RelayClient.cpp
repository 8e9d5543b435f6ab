#include "RelayClient.hpp"

namespace relay {
RelayClient::RelayClient(shared_ptr<SocketHandler> _socketHandler,
                         const SocketEndpoint& endpoint,
                         shared_ptr<MessageCodec> _codec)
    : socketHandler(_socketHandler), codec(_codec), fd(-1) {
  fd = socketHandler->connect(endpoint);
  if (fd < 0) {
    throw std::runtime_error("Could not connect to relay server");
  }
}

RelayClient::RelayClient(shared_ptr<SocketHandler> _socketHandler, int _fd,
                         shared_ptr<MessageCodec> _codec)
    : socketHandler(_socketHandler), codec(_codec), fd(_fd) {}

RelayClient::~RelayClient() { close(); }

bool RelayClient::authenticate(AuthChoice choice, const string& username,
                               const string& password) {
  if (choice == AuthChoice::NONE) {
    STFATAL << "Tried to authenticate without a choice";
  }
  string token = readToken();
  if (token != TOKEN_AUTH_REQUIRED) {
    LOG(WARNING) << "Expected " << TOKEN_AUTH_REQUIRED << ", got " << token;
    return false;
  }
  sendToken(choice == AuthChoice::LOGIN ? TOKEN_LOGIN : TOKEN_REGISTER);
  if (readToken() != TOKEN_ENTER_USERNAME) {
    return false;
  }
  sendToken(username);
  string reply = readToken();
  if (reply == TOKEN_USERNAME_EXISTS) {
    LOG(INFO) << username << " is already registered";
    return false;
  }
  if (reply != TOKEN_ENTER_PASSWORD) {
    return false;
  }
  sendToken(password);
  return readToken() == TOKEN_AUTH_SUCCESS;
}

string RelayClient::readToken() { return socketHandler->readFrame(fd, true); }

void RelayClient::sendToken(const string& token) {
  socketHandler->writeFrame(fd, token);
}

void RelayClient::sendChat(const string& text) {
  socketHandler->writeFrame(fd, codec->encode(text));
}

optional<string> RelayClient::receive(int timeoutMs) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (!socketHandler->hasData(fd)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return codec->decode(socketHandler->readFrame(fd, true));
}

void RelayClient::quit() { sendChat("/quit"); }

void RelayClient::close() {
  if (fd >= 0) {
    socketHandler->close(fd);
    fd = -1;
  }
}
}  // namespace relay
