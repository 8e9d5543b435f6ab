#include "ConnectionManager.hpp"

#include "WireTokens.hpp"

namespace relay {
ConnectionManager::ConnectionManager(shared_ptr<SocketHandler> _socketHandler,
                                     const SocketEndpoint& _serverEndpoint,
                                     shared_ptr<CredentialStore> _store,
                                     shared_ptr<MessageCodec> _codec,
                                     shared_ptr<PasswordHasher> _hasher,
                                     const ServerConfig& _config)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      store(_store),
      codec(_codec),
      hasher(_hasher),
      config(_config),
      registry(new ClientRegistry()),
      halt(false),
      listening(false),
      accepting(false),
      nextSessionId(1) {
  router.reset(new BroadcastRouter(registry, codec));
}

ConnectionManager::~ConnectionManager() { shutdown(); }

void ConnectionManager::listen() {
  lock_guard<std::mutex> guard(listenMutex);
  if (listening) {
    return;
  }
  socketHandler->listen(serverEndpoint);
  listening = true;
  LOG(INFO) << "Listening on " << serverEndpoint << " with codec "
            << codec->name();
}

shared_ptr<ClientSession> ConnectionManager::accept() {
  set<int> serverFds = socketHandler->getEndpointFds(serverEndpoint);
  while (!halt) {
    fd_set rfds;
    FD_ZERO(&rfds);
    int maxFd = 0;
    for (int fd : serverFds) {
      FD_SET(fd, &rfds);
      maxFd = max(maxFd, fd);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100 * 1000;
    int numFdsSet = select(maxFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (halt) {
        // The listening sockets were closed by shutdown().
        VLOG(1) << "select() failed while shutting down: " << strerror(errno);
        break;
      }
      FATAL_FAIL(numFdsSet);
    }
    if (numFdsSet == 0) {
      continue;
    }
    for (int fd : serverFds) {
      if (!FD_ISSET(fd, &rfds)) {
        continue;
      }
      int clientFd = socketHandler->accept(fd);
      if (clientFd >= 0) {
        return adopt(clientFd);
      }
    }
  }
  return shared_ptr<ClientSession>();
}

shared_ptr<ClientSession> ConnectionManager::adopt(int fd) {
  auto session =
      make_shared<ClientSession>(socketHandler, fd, nextSessionId++);
  LOG(INFO) << "New connection " << session->getName() << " on fd " << fd;
  return session;
}

void ConnectionManager::spawnWorker(shared_ptr<ClientSession> session) {
  reapFinishedWorkers();
  lock_guard<std::mutex> guard(workerMutex);
  if (halt) {
    LOG(INFO) << "Shutting down, dropping " << session->getName();
    session->close();
    return;
  }
  Worker worker;
  worker.session = session;
  worker.done.reset(new std::atomic<bool>(false));
  auto done = worker.done;
  worker.thread.reset(new std::thread([this, session, done]() {
    serveSession(session);
    *done = true;
  }));
  workers.push_back(worker);
}

void ConnectionManager::run() {
  {
    lock_guard<std::mutex> guard(listenMutex);
    if (halt) {
      return;
    }
    accepting = true;
  }
  try {
    listen();
  } catch (const std::runtime_error& re) {
    lock_guard<std::mutex> guard(listenMutex);
    accepting = false;
    throw;
  }
  while (!halt) {
    auto session = accept();
    if (!session) {
      break;
    }
    spawnWorker(session);
  }
  {
    lock_guard<std::mutex> guard(listenMutex);
    accepting = false;
  }
  stopListening();
  LOG(INFO) << "Accept loop finished";
}

void ConnectionManager::stopListening() {
  lock_guard<std::mutex> guard(listenMutex);
  if (listening) {
    socketHandler->stopListening(serverEndpoint);
    listening = false;
  }
}

void ConnectionManager::shutdown() {
  if (halt.exchange(true)) {
    return;
  }
  LOG(INFO) << "Shutting down connection manager";
  {
    lock_guard<std::mutex> guard(listenMutex);
    // A running accept loop closes its own sockets once it sees halt.
    if (listening && !accepting) {
      socketHandler->stopListening(serverEndpoint);
      listening = false;
    }
  }
  vector<Worker> toJoin;
  {
    lock_guard<std::mutex> guard(workerMutex);
    toJoin.swap(workers);
  }
  for (auto& worker : toJoin) {
    worker.session->interrupt();
  }
  for (auto& worker : toJoin) {
    worker.thread->join();
  }
  LOG(INFO) << "Joined " << toJoin.size() << " workers";
}

int ConnectionManager::getActiveWorkerCount() {
  lock_guard<std::mutex> guard(workerMutex);
  int count = 0;
  for (const auto& worker : workers) {
    if (!*worker.done) {
      count++;
    }
  }
  return count;
}

void ConnectionManager::reapFinishedWorkers() {
  vector<Worker> finished;
  {
    lock_guard<std::mutex> guard(workerMutex);
    auto it = workers.begin();
    while (it != workers.end()) {
      if (*it->done) {
        finished.push_back(*it);
        it = workers.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& worker : finished) {
    worker.thread->join();
  }
}

void ConnectionManager::serveSession(shared_ptr<ClientSession> session) {
  el::Helpers::setThreadName(session->getName());

  try {
    if (authenticate(session)) {
      string username = *session->getUsername();
      LOG(INFO) << session->getName() << " joined as " << username;
      replayHistory(session);
      router->deliver(formatJoinNotice(username), session);
      relayMessages(session);
    }
  } catch (const DecodeError& de) {
    LOG(WARNING) << session->getName() << " sent a bad envelope ("
                 << (de.getKind() == DecodeError::TAMPER_DETECTED
                         ? "tamper detected"
                         : "malformed")
                 << "), closing";
  } catch (const std::runtime_error& re) {
    LOG(INFO) << session->getName() << " connection ended: " << re.what();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Got an unexpected error handling " << session->getName()
               << ": " << e.what();
  }

  if (session->getState() == AUTHENTICATED) {
    string username = *session->getUsername();
    registry->deregisterSession(session);
    try {
      router->deliver(formatLeaveNotice(username), session);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Failed to announce departure of " << username << ": "
                 << e.what();
    }
    LOG(INFO) << username << " left";
  }
  session->close();
}

bool ConnectionManager::authenticate(const shared_ptr<ClientSession>& session) {
  AuthenticationStateMachine machine(
      store, hasher, config.auth,
      [this](const string& username) { return registry->isOnline(username); },
      [this, session](const string& username) {
        return registry->registerSession(session, username);
      });

  {
    auto writeLock = session->lockWrites();
    for (const auto& token : machine.start()) {
      session->send(token);
    }
    session->setState(machine.getState());
  }

  while (!machine.isFinished()) {
    string input = session->receive();
    // The write lock is held across the step so a freshly registered
    // session gets AUTH_SUCCESS before any broadcast.
    auto writeLock = session->lockWrites();
    auto tokens = machine.handleInput(input);
    if (machine.getState() == AUTHENTICATED) {
      // Set before AUTH_SUCCESS goes out so a failed send still tears the
      // registration down.
      session->setUsername(machine.getUsername());
    }
    session->setState(machine.getState());
    for (const auto& token : tokens) {
      session->send(token);
    }
  }
  return machine.getState() == AUTHENTICATED;
}

void ConnectionManager::replayHistory(
    const shared_ptr<ClientSession>& session) {
  if (config.replayOnJoin <= 0) {
    return;
  }
  vector<ChatMessage> history;
  try {
    history = store->fetchHistory(config.replayOnJoin);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not load history: " << re.what();
    return;
  }
  VLOG(1) << "Replaying " << history.size() << " messages to "
          << session->getName();
  for (const auto& message : history) {
    session->send(codec->encode(formatChatLine(message)));
  }
}

void ConnectionManager::relayMessages(
    const shared_ptr<ClientSession>& session) {
  string username = *session->getUsername();
  while (!halt) {
    string text = codec->decode(session->receive());
    if (isQuitCommand(text)) {
      LOG(INFO) << username << " quit";
      return;
    }

    ChatMessage message;
    message.set_sender(username);
    message.set_text(text);
    message.set_timestamp(time(NULL));

    try {
      store->appendHistory(message);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Could not store message from " << username << ": "
                   << re.what();
    }
    router->deliver(message, session);
  }
}
}  // namespace relay
