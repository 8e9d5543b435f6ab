#ifndef __RELAY_DAEMON_CREATOR__
#define __RELAY_DAEMON_CREATOR__

#include "Headers.hpp"

namespace relay {
/**
 * @brief Detaches relayserver from its controlling terminal.
 */
class DaemonCreator {
 public:
  /**
   * @brief Double-forks into a new session and points stdio at /dev/null.
   * @param pidFile When non-empty, the daemon's pid is written there.
   * @return Only in the daemon; the intermediate processes exit.
   */
  static void daemonize(const string& pidFile);

 protected:
  static void writePidFile(const string& pidFile);
};
}  // namespace relay

#endif  // __RELAY_DAEMON_CREATOR__
