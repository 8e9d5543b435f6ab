#ifndef __RELAY_CONNECTION_MANAGER__
#define __RELAY_CONNECTION_MANAGER__

#include "AuthenticationStateMachine.hpp"
#include "BroadcastRouter.hpp"
#include "ClientRegistry.hpp"
#include "CredentialStore.hpp"
#include "MessageCodec.hpp"
#include "PasswordHasher.hpp"
#include "ServerConfig.hpp"
#include "SocketHandler.hpp"

namespace relay {
/**
 * @brief Accepts connections and runs one worker thread per connection.
 *
 * A worker authenticates its session, registers it, announces the join,
 * relays chat payloads until the peer leaves, and always deregisters and
 * releases the descriptor on the way out. No worker failure reaches the
 * accept loop.
 */
class ConnectionManager {
 public:
  ConnectionManager(shared_ptr<SocketHandler> _socketHandler,
                    const SocketEndpoint& _serverEndpoint,
                    shared_ptr<CredentialStore> _store,
                    shared_ptr<MessageCodec> _codec,
                    shared_ptr<PasswordHasher> _hasher,
                    const ServerConfig& _config);
  virtual ~ConnectionManager();

  /**
   * @brief Starts listening on the server endpoint.
   * @throws std::runtime_error when the endpoint cannot be bound.
   */
  void listen();

  /**
   * @brief Blocks until a connection arrives.
   * @return The new session, or null once shutdown() has been called.
   */
  shared_ptr<ClientSession> accept();

  /**
   * @brief Wraps an already connected descriptor in a session. The descriptor
   * must be tracked by the socket handler.
   */
  shared_ptr<ClientSession> adopt(int fd);

  /** @brief Starts the worker thread that owns @p session until teardown. */
  void spawnWorker(shared_ptr<ClientSession> session);

  /**
   * @brief Accept loop; returns after shutdown(). The loop closes the
   * listening sockets itself on the way out.
   */
  void run();

  /**
   * @brief Stops accepting, interrupts every session and joins all workers.
   */
  void shutdown();

  bool isShuttingDown() { return halt; }

  /** @brief Number of workers that have not finished yet. */
  int getActiveWorkerCount();

  shared_ptr<ClientRegistry> getRegistry() { return registry; }
  shared_ptr<BroadcastRouter> getRouter() { return router; }

 protected:
  struct Worker {
    shared_ptr<ClientSession> session;
    shared_ptr<std::thread> thread;
    shared_ptr<std::atomic<bool>> done;
  };

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<CredentialStore> store;
  shared_ptr<MessageCodec> codec;
  shared_ptr<PasswordHasher> hasher;
  ServerConfig config;

  shared_ptr<ClientRegistry> registry;
  shared_ptr<BroadcastRouter> router;

  std::atomic<bool> halt;
  // Guards listening/accepting. While run() is accepting, only its thread
  // closes the listening sockets.
  std::mutex listenMutex;
  bool listening;
  bool accepting;
  std::atomic<int64_t> nextSessionId;

  std::mutex workerMutex;
  vector<Worker> workers;

  void stopListening();
  void serveSession(shared_ptr<ClientSession> session);
  bool authenticate(const shared_ptr<ClientSession>& session);
  void replayHistory(const shared_ptr<ClientSession>& session);
  void relayMessages(const shared_ptr<ClientSession>& session);
  void reapFinishedWorkers();
};
}  // namespace relay

#endif  // __RELAY_CONNECTION_MANAGER__
