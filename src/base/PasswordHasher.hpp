#ifndef __RELAY_PASSWORD_HASHER__
#define __RELAY_PASSWORD_HASHER__

#include "Headers.hpp"

namespace relay {
/**
 * @brief Derives the password hash handed to a CredentialStore.
 *
 * The hash is Argon2id over the password, salted with a BLAKE2b digest of the
 * username, so the same (username, password) pair always yields the same
 * hex string.
 */
class PasswordHasher {
 public:
  /** @brief Uses libsodium's interactive work factors. */
  PasswordHasher();
  PasswordHasher(unsigned long long _opslimit, size_t _memlimit);

  /** @brief Work factors small enough for unit tests. */
  static PasswordHasher minimal();

  string hash(const string& username, const string& password) const;

 protected:
  unsigned long long opslimit;
  size_t memlimit;
};
}  // namespace relay

#endif  // __RELAY_PASSWORD_HASHER__
