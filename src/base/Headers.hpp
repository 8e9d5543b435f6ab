#ifndef __RELAY_HEADERS__
#define __RELAY_HEADERS__

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <pthread.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <errno.h>
#include <google/protobuf/message_lite.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "Relay.pb.h"
#include "easylogging++.h"

namespace fs = std::filesystem;

using namespace std;

#define STFATAL LOG(FATAL)

#define STERROR LOG(ERROR)

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)      \
  if (((X) == -1) && errno != EINVAL) \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef RELAY_VERSION
#define RELAY_VERSION "unknown"
#endif

namespace relay {
// Largest frame accepted on the wire, auth tokens and envelopes alike.
static const int64_t MAX_FRAME_SIZE = 64 * 1024;

inline std::ostream &operator<<(std::ostream &os,
                                const relay::SocketEndpoint &se) {
  if (se.has_name()) {
    os << se.name();
  }
  if (se.has_port()) {
    os << ":" << se.port();
  }
  return os;
}

inline string trim(const string &s) {
  const char *whitespace = " \t\r\n";
  auto begin = s.find_first_not_of(whitespace);
  if (begin == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

inline string toUpper(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

inline bool waitOnSocketData(int fd) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = 1;
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc == -1) {
    if (errno == EINTR) {
      return false;
    }
    // The descriptor went away underneath us: let the read report it.
    return true;
  }
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  const char *tmpDir = ::getenv("TMPDIR");
  if (tmpDir != NULL && tmpDir[0] != '\0') {
    string s(tmpDir);
    if (s.back() != '/') {
      s.push_back('/');
    }
    return s;
  }
  return "/tmp/";
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace relay

#endif  // __RELAY_HEADERS__
