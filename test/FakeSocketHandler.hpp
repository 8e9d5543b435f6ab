#ifndef __RELAY_FAKE_SOCKET_HANDLER__
#define __RELAY_FAKE_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace relay {
/**
 * In-memory SocketHandler. Every fake descriptor has an inbound buffer that
 * tests fill with push() and an outbound buffer that records writes.
 */
class FakeSocketHandler : public SocketHandler {
 public:
  FakeSocketHandler() : nextFd(500) {}

  int fakeConnection() {
    lock_guard<std::mutex> guard(handlerMutex);
    int fd = nextFd++;
    openFds.insert(fd);
    return fd;
  }

  void failWrites(int fd) {
    lock_guard<std::mutex> guard(handlerMutex);
    failingFds.insert(fd);
  }

  void push(int fd, const string& bytes) {
    lock_guard<std::mutex> guard(handlerMutex);
    inBuffers[fd].append(bytes);
  }

  void pushFrame(int fd, const string& payload) {
    int64_t length = payload.length();
    push(fd, string((const char*)&length, sizeof(int64_t)) + payload);
  }

  // Splits everything written to fd so far into frame payloads.
  vector<string> writtenFrames(int fd) {
    lock_guard<std::mutex> guard(handlerMutex);
    vector<string> frames;
    const string& out = outBuffers[fd];
    size_t pos = 0;
    while (pos + sizeof(int64_t) <= out.length()) {
      int64_t length;
      memcpy(&length, out.data() + pos, sizeof(int64_t));
      pos += sizeof(int64_t);
      frames.push_back(out.substr(pos, length));
      pos += length;
    }
    return frames;
  }

  bool wasInterrupted(int fd) {
    lock_guard<std::mutex> guard(handlerMutex);
    return interruptedFds.count(fd) > 0;
  }

  bool isOpen(int fd) {
    lock_guard<std::mutex> guard(handlerMutex);
    return openFds.count(fd) > 0;
  }

  virtual bool hasData(int fd) {
    lock_guard<std::mutex> guard(handlerMutex);
    return !inBuffers[fd].empty() || interruptedFds.count(fd);
  }

  virtual ssize_t read(int fd, void* buf, size_t count) {
    lock_guard<std::mutex> guard(handlerMutex);
    if (!openFds.count(fd)) {
      errno = EBADF;
      return -1;
    }
    string& in = inBuffers[fd];
    if (in.empty()) {
      if (interruptedFds.count(fd)) {
        return 0;
      }
      errno = EAGAIN;
      return -1;
    }
    size_t n = min(count, in.length());
    memcpy(buf, in.data(), n);
    in.erase(0, n);
    return n;
  }

  virtual ssize_t write(int fd, const void* buf, size_t count) {
    lock_guard<std::mutex> guard(handlerMutex);
    if (!openFds.count(fd) || failingFds.count(fd) ||
        interruptedFds.count(fd)) {
      errno = EPIPE;
      return -1;
    }
    outBuffers[fd].append((const char*)buf, count);
    return count;
  }

  virtual int connect(const SocketEndpoint& endpoint) { return -1; }
  virtual set<int> listen(const SocketEndpoint& endpoint) {
    return set<int>();
  }
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) {
    return set<int>();
  }
  virtual int accept(int fd) { return -1; }
  virtual void stopListening(const SocketEndpoint& endpoint) {}

  virtual void interrupt(int fd) {
    lock_guard<std::mutex> guard(handlerMutex);
    interruptedFds.insert(fd);
  }

  virtual void close(int fd) {
    lock_guard<std::mutex> guard(handlerMutex);
    openFds.erase(fd);
  }

  virtual vector<int> getActiveSockets() {
    lock_guard<std::mutex> guard(handlerMutex);
    return vector<int>(openFds.begin(), openFds.end());
  }

 protected:
  std::mutex handlerMutex;
  int nextFd;
  set<int> openFds;
  set<int> failingFds;
  set<int> interruptedFds;
  map<int, string> inBuffers;
  map<int, string> outBuffers;
};
}  // namespace relay

#endif  // __RELAY_FAKE_SOCKET_HANDLER__
