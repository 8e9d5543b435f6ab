#include "TcpSocketHandler.hpp"

namespace relay {
namespace {
struct AddrInfoDeleter {
  void operator()(addrinfo* info) const { freeaddrinfo(info); }
};
typedef std::unique_ptr<addrinfo, AddrInfoDeleter> AddrInfoList;

AddrInfoList resolve(const SocketEndpoint& endpoint, const char* host,
                     int flags) {
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = flags;
  string port = to_string(endpoint.port());

  addrinfo* results = NULL;
  int rc = getaddrinfo(host, port.c_str(), &hints, &results);
  if (rc != 0) {
    stringstream oss;
    oss << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    throw std::runtime_error(oss.str());
  }
  return AddrInfoList(results);
}
}  // namespace

TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  string host = endpoint.has_name() ? endpoint.name() : "localhost";
  AddrInfoList results;
  try {
    results = resolve(endpoint, host.c_str(), AI_ADDRCONFIG);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << re.what();
    return -1;
  }

  for (addrinfo* p = results.get(); p != NULL; p = p->ai_next) {
    int sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      continue;
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      VLOG(1) << "Connect to " << endpoint << " failed: " << strerror(errno);
      ::close(sockFd);
      continue;
    }
    VLOG(1) << "Connected to " << endpoint << " on fd " << sockFd;
    addToActiveSockets(sockFd);
    initSocket(sockFd);
    return sockFd;
  }
  LOG(ERROR) << "Could not connect to " << endpoint;
  return -1;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int port = endpoint.port();
  if (portServerSockets.count(port)) {
    STFATAL << "Tried to listen twice on port " << port;
  }

  // No name means every interface.
  const char* bindName = NULL;
  if (endpoint.has_name() && !endpoint.name().empty()) {
    bindName = endpoint.name().c_str();
  }
  AddrInfoList results = resolve(endpoint, bindName, AI_PASSIVE);

  set<int> serverSockets;
  for (addrinfo* p = results.get(); p != NULL; p = p->ai_next) {
    int sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      continue;
    }
    initServerSocket(sockFd);
    if (p->ai_family == AF_INET6) {
      // IPv4 gets its own socket
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char*)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1 ||
        ::listen(sockFd, 32) == -1) {
      string error = strerror(errno);
      ::close(sockFd);
      for (int fd : serverSockets) {
        ::close(fd);
      }
      throw std::runtime_error("Cannot listen on port " + to_string(port) +
                               ": " + error);
    }
    serverSockets.insert(sockFd);
  }

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface");
  }
  LOG(INFO) << "Listening on " << endpoint << " with " << serverSockets.size()
            << " socket(s)";
  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = portServerSockets.find(endpoint.port());
  if (it == portServerSockets.end()) {
    STFATAL << "Not listening on port " << endpoint.port();
  }
  return it->second;
}

void TcpSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = portServerSockets.find(endpoint.port());
  if (it == portServerSockets.end()) {
    LOG(WARNING) << "Not listening on port " << endpoint.port();
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char*)&flag, sizeof(int)));
}
}  // namespace relay
