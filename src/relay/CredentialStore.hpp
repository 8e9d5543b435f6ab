#ifndef __RELAY_CREDENTIAL_STORE__
#define __RELAY_CREDENTIAL_STORE__

#include "Headers.hpp"

namespace relay {
/**
 * @brief Persistence contract for user credentials and chat history.
 *
 * Implementations serialize their own writes and may be called from any
 * worker thread. Every method may throw std::runtime_error when the backing
 * storage fails.
 */
class CredentialStore {
 public:
  enum CreateResult { OK, CONFLICT };

  virtual ~CredentialStore() {}

  /**
   * @brief Creates a credential. Returns CONFLICT when the username is already
   * taken, including when another worker created it first.
   */
  virtual CreateResult createCredential(const string& username,
                                        const string& passwordHash) = 0;

  /**
   * @brief True only if @p username exists and its stored hash equals
   * @p passwordHash.
   */
  virtual bool verifyCredential(const string& username,
                                const string& passwordHash) = 0;

  virtual bool credentialExists(const string& username) = 0;

  /** @brief Records one chat message. */
  virtual void appendHistory(const ChatMessage& message) = 0;

  /**
   * @brief Returns up to @p limit of the most recent messages, oldest first.
   */
  virtual vector<ChatMessage> fetchHistory(int limit) = 0;
};
}  // namespace relay

#endif  // __RELAY_CREDENTIAL_STORE__
