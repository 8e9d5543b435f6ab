#ifndef __RELAY_SERVER_CONFIG__
#define __RELAY_SERVER_CONFIG__

#include "Headers.hpp"

namespace relay {
/**
 * @brief Authentication policy shared by every connection.
 */
struct AuthPolicy {
  /** @brief Returns to AWAIT_CHOICE allowed before the client is rejected. */
  int maxAttempts = 3;
  int minUsernameLength = 3;
  int minPasswordLength = 6;
};

/**
 * @brief Settings for relayserver, filled from the config file and then
 * overridden by command line flags.
 */
struct ServerConfig {
  int port = 5555;
  string bindIp;

  string codec = "aead";
  string passphrase;

  AuthPolicy auth;

  string database = "relay.db";

  /** @brief Number of stored messages replayed to a client on join, 0 to disable. */
  int replayOnJoin = 0;

  /** @brief Verbose level from the file, -1 when not set. */
  int verbose = -1;
  bool silent = false;
  // default max log file size is 20MB
  string maxLogSize = "20971520";
  string logDir;
};

/**
 * @brief Reads the INI file at @p filename into @p config. Keys missing from
 * the file leave the corresponding field untouched.
 * @return false when the file cannot be loaded or a numeric key is invalid.
 */
bool loadConfigFile(const string& filename, ServerConfig* config);
}  // namespace relay

#endif  // __RELAY_SERVER_CONFIG__
