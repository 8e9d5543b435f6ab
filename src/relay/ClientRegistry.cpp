#include "ClientRegistry.hpp"

namespace relay {
bool ClientRegistry::registerSession(shared_ptr<ClientSession> session,
                                     const string& username) {
  lock_guard<std::mutex> guard(registryMutex);
  if (usernames.find(username) != usernames.end()) {
    LOG(INFO) << "Username already online: " << username;
    return false;
  }
  if (entries.find(session->getId()) != entries.end()) {
    LOG(WARNING) << session->getName() << " is already registered";
    return false;
  }
  Entry entry;
  entry.session = session;
  entry.username = username;
  entries[session->getId()] = entry;
  usernames[username] = session->getId();
  VLOG(1) << "Registered " << session->getName() << " as " << username;
  return true;
}

bool ClientRegistry::deregisterSession(
    const shared_ptr<ClientSession>& session) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = entries.find(session->getId());
  if (it == entries.end()) {
    return false;
  }
  usernames.erase(it->second.username);
  VLOG(1) << "Deregistered " << session->getName() << " ("
          << it->second.username << ")";
  entries.erase(it);
  return true;
}

vector<ClientRegistry::Entry> ClientRegistry::snapshot() {
  lock_guard<std::mutex> guard(registryMutex);
  vector<Entry> result;
  result.reserve(entries.size());
  for (const auto& it : entries) {
    result.push_back(it.second);
  }
  return result;
}

bool ClientRegistry::isOnline(const string& username) {
  lock_guard<std::mutex> guard(registryMutex);
  return usernames.find(username) != usernames.end();
}

size_t ClientRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  return entries.size();
}
}  // namespace relay
