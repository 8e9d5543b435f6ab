#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace relay {
namespace {
bool readInt(const CSimpleIniA& ini, const char* section, const char* key,
             int* value) {
  const char* s = ini.GetValue(section, key, NULL);
  if (!s) {
    return true;
  }
  try {
    *value = stoi(s);
  } catch (const std::logic_error& e) {
    LOG(WARNING) << "Invalid value for [" << section << "] " << key << ": "
                 << s;
    return false;
  }
  return true;
}

void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* value) {
  const char* s = ini.GetValue(section, key, NULL);
  if (s) {
    *value = string(s);
  }
}
}  // namespace

bool loadConfigFile(const string& filename, ServerConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Could not load config file " << filename << ": " << rc;
    return false;
  }

  bool ok = readInt(ini, "Networking", "port", &config->port);
  readString(ini, "Networking", "bind_ip", &config->bindIp);

  readString(ini, "Security", "codec", &config->codec);
  readString(ini, "Security", "passphrase", &config->passphrase);

  ok = readInt(ini, "Auth", "max_attempts", &config->auth.maxAttempts) && ok;
  ok = readInt(ini, "Auth", "min_username_length",
               &config->auth.minUsernameLength) &&
       ok;
  ok = readInt(ini, "Auth", "min_password_length",
               &config->auth.minPasswordLength) &&
       ok;

  readString(ini, "Storage", "database", &config->database);

  ok = readInt(ini, "History", "replay_on_join", &config->replayOnJoin) && ok;

  ok = readInt(ini, "Debug", "verbose", &config->verbose) && ok;
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = atoi(silent) != 0;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config->maxLogSize = string(logsize);
  }
  readString(ini, "Debug", "logdir", &config->logDir);

  return ok;
}
}  // namespace relay
