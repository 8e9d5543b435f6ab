#include "SocketHandler.hpp"

namespace relay {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    if (!waitOnSocketData(fd)) {
      time_t currentTime = time(NULL);
      if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // Peer closed (or we were interrupted): surface it as a broken pipe.
      errno = EPIPE;
      bytesRead = -1;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        VLOG(3) << "Got EAGAIN, waiting...";
      } else {
        VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to readAll");
      }
    } else {
      pos += bytesRead;
      startTime = time(NULL);
    }
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        VLOG(3) << "Got EAGAIN, waiting...";
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } else {
        VLOG(1) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}

string SocketHandler::readFrame(int fd, bool timeout) {
  int64_t length;
  readAll(fd, &length, sizeof(int64_t), timeout);
  if (length < 0 || length > MAX_FRAME_SIZE) {
    string s = string("Invalid frame size: ") + to_string(length);
    throw std::runtime_error(s.c_str());
  }
  string s(length, '\0');
  if (length > 0) {
    readAll(fd, &s[0], length, timeout);
  }
  return s;
}

void SocketHandler::writeFrame(int fd, const string& payload) {
  int64_t length = payload.length();
  if (length > MAX_FRAME_SIZE) {
    throw std::runtime_error("Frame too large: " + to_string(length));
  }
  // Header and body go out in a single buffer.
  string s(sizeof(int64_t) + payload.length(), '\0');
  memcpy(&s[0], &length, sizeof(int64_t));
  if (length > 0) {
    memcpy(&s[sizeof(int64_t)], payload.data(), payload.length());
  }
  writeAllOrThrow(fd, s.data(), s.length(), true);
}
}  // namespace relay
