#include "ServerConfig.hpp"

#include "TestHeaders.hpp"

using namespace relay;

namespace {
string writeConfig(const string& directory, const string& contents) {
  string path = directory + "/relay.cfg";
  std::ofstream out(path);
  out << contents;
  return path;
}
}  // namespace

TEST_CASE("ServerConfig", "[ServerConfig]") {
  string tmpPath = GetTempDirectory() + string("relay_test_cfg_XXXXXXXX");
  string directory = string(mkdtemp(&tmpPath[0]));
  ServerConfig config;

  SECTION("Defaults") {
    REQUIRE(config.port == 5555);
    REQUIRE(config.codec == "aead");
    REQUIRE(config.auth.maxAttempts == 3);
    REQUIRE(config.auth.minUsernameLength == 3);
    REQUIRE(config.auth.minPasswordLength == 6);
    REQUIRE(config.database == "relay.db");
    REQUIRE(config.replayOnJoin == 0);
    REQUIRE(config.maxLogSize == "20971520");
  }

  SECTION("Every section") {
    string path = writeConfig(directory,
                              "[Networking]\n"
                              "port = 6000\n"
                              "bind_ip = 127.0.0.1\n"
                              "[Security]\n"
                              "codec = plaintext\n"
                              "passphrase = open sesame\n"
                              "[Auth]\n"
                              "max_attempts = 5\n"
                              "min_username_length = 4\n"
                              "min_password_length = 10\n"
                              "[Storage]\n"
                              "database = /tmp/chat.db\n"
                              "[History]\n"
                              "replay_on_join = 20\n"
                              "[Debug]\n"
                              "verbose = 2\n"
                              "silent = 1\n"
                              "logsize = 1048576\n"
                              "logdir = /tmp/relaylogs\n");
    REQUIRE(loadConfigFile(path, &config));
    REQUIRE(config.port == 6000);
    REQUIRE(config.bindIp == "127.0.0.1");
    REQUIRE(config.codec == "plaintext");
    REQUIRE(config.passphrase == "open sesame");
    REQUIRE(config.auth.maxAttempts == 5);
    REQUIRE(config.auth.minUsernameLength == 4);
    REQUIRE(config.auth.minPasswordLength == 10);
    REQUIRE(config.database == "/tmp/chat.db");
    REQUIRE(config.replayOnJoin == 20);
    REQUIRE(config.verbose == 2);
    REQUIRE(config.silent);
    REQUIRE(config.maxLogSize == "1048576");
    REQUIRE(config.logDir == "/tmp/relaylogs");
  }

  SECTION("Missing keys keep their values") {
    string path = writeConfig(directory, "[Networking]\nport = 7000\n");
    REQUIRE(loadConfigFile(path, &config));
    REQUIRE(config.port == 7000);
    REQUIRE(config.codec == "aead");
    REQUIRE(config.auth.maxAttempts == 3);
    REQUIRE(config.verbose == -1);
  }

  SECTION("Bad number") {
    string path = writeConfig(directory, "[Auth]\nmax_attempts = lots\n");
    REQUIRE_FALSE(loadConfigFile(path, &config));
    REQUIRE(config.auth.maxAttempts == 3);
  }

  SECTION("Missing file") {
    REQUIRE_FALSE(loadConfigFile(directory + "/nope.cfg", &config));
  }

  fs::remove_all(directory);
}
