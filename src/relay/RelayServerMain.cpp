#include <cxxopts.hpp>

#include "ConnectionManager.hpp"
#include "DaemonCreator.hpp"
#include "LogHandler.hpp"
#include "SqliteCredentialStore.hpp"
#include "TcpSocketHandler.hpp"

using namespace relay;

namespace {
volatile sig_atomic_t stopRequested = 0;

void StopSignalHandler(int signum) { stopRequested = signum; }
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  relay::HandleTerminate();

  cxxopts::Options options("relayserver",
                           "Authenticated broadcast chat relay");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on", cxxopts::value<int>())  //
        ("bindip", "IP to listen on", cxxopts::value<string>())  //
        ("daemon", "Daemonize the server")                      //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files", cxxopts::value<string>())  //
        ("pidfile", "Location of the pid file",
         cxxopts::value<std::string>()->default_value(
             "/var/run/relayserver.pid"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("database", "Path of the SQLite database",
         cxxopts::value<string>())  //
        ("codec", "Payload codec: aead or plaintext",
         cxxopts::value<string>())  //
        ("passphrase", "Shared passphrase the aead key is derived from",
         cxxopts::value<string>())  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "relayserver version " << RELAY_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty() && !loadConfigFile(cfgfilename, &config)) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }

    // Command line flags win over the config file
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("database")) {
      config.database = result["database"].as<string>();
    }
    if (result.count("codec")) {
      config.codec = result["codec"].as<string>();
    }
    if (result.count("passphrase")) {
      config.passphrase = result["passphrase"].as<string>();
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
    if (config.logDir.empty()) {
      config.logDir = GetTempDirectory() + "relayserver";
    }

    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else if (config.verbose >= 0) {
      el::Loggers::setVerboseLevel(config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    shared_ptr<MessageCodec> codec;
    try {
      codec = createMessageCodec(config.codec, config.passphrase);
    } catch (const std::runtime_error &re) {
      CLOG(INFO, "stdout") << "Invalid codec settings: " << re.what() << endl;
      exit(1);
    }

    if (result.count("daemon")) {
      // The daemon runs from "/", so pin relative paths first.
      config.database = fs::absolute(config.database).string();
      config.logDir = fs::absolute(config.logDir).string();
      DaemonCreator::daemonize(result["pidfile"].as<string>());
    }

    bool logToStdout = result.count("logtostdout") > 0;
    if (!logToStdout) {
      // Redirect std streams to a file
      LogHandler::stderrToFile(config.logDir, "relayserver");
    }

    // Set log file for relayserver process here.
    string logFile =
        LogHandler::setupLogFile(&defaultConf, config.logDir, "relayserver",
                                 logToStdout, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("relayserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    LOG(INFO) << "Logging to " << logFile;

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    shared_ptr<SqliteCredentialStore> store;
    try {
      store.reset(new SqliteCredentialStore(config.database));
      LOG(INFO) << "Registered users: " << store->countUsers()
                << ", stored messages: " << store->countMessages();
    } catch (const std::runtime_error &re) {
      STFATAL << "Could not open database " << config.database << ": "
              << re.what();
    }

    shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    SocketEndpoint serverEndpoint;
    serverEndpoint.set_port(config.port);
    if (config.bindIp.length()) {
      serverEndpoint.set_name(config.bindIp);
    }
    shared_ptr<PasswordHasher> hasher(new PasswordHasher());
    ConnectionManager connectionManager(tcpSocketHandler, serverEndpoint,
                                        store, codec, hasher, config);
    try {
      connectionManager.listen();
    } catch (const std::runtime_error &re) {
      STFATAL << re.what();
    }

    ::signal(SIGINT, StopSignalHandler);
    ::signal(SIGTERM, StopSignalHandler);
    ::signal(SIGPIPE, SIG_IGN);

    std::thread acceptThread([&connectionManager]() {
      el::Helpers::setThreadName("relayserver-accept");
      connectionManager.run();
    });
    while (!stopRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    LOG(INFO) << "Got signal " << stopRequested << ", shutting down";
    connectionManager.shutdown();
    acceptThread.join();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
