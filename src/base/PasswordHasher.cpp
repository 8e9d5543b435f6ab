#include "PasswordHasher.hpp"

namespace relay {
namespace {
const size_t HASH_BYTES = 32;
}

PasswordHasher::PasswordHasher()
    : PasswordHasher(crypto_pwhash_OPSLIMIT_INTERACTIVE,
                     crypto_pwhash_MEMLIMIT_INTERACTIVE) {}

PasswordHasher::PasswordHasher(unsigned long long _opslimit, size_t _memlimit)
    : opslimit(_opslimit), memlimit(_memlimit) {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
}

PasswordHasher PasswordHasher::minimal() {
  return PasswordHasher(crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN);
}

string PasswordHasher::hash(const string& username,
                            const string& password) const {
  unsigned char salt[crypto_pwhash_SALTBYTES];
  crypto_generichash(salt, sizeof(salt), (const unsigned char*)username.data(),
                     username.length(), NULL, 0);

  unsigned char out[HASH_BYTES];
  if (crypto_pwhash(out, sizeof(out), password.data(), password.length(), salt,
                    opslimit, memlimit, crypto_pwhash_ALG_ARGON2ID13) != 0) {
    // Only happens when the memory limit cannot be allocated.
    throw std::runtime_error("Out of memory while hashing password");
  }

  char hex[HASH_BYTES * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), out, sizeof(out));
  sodium_memzero(out, sizeof(out));
  return string(hex);
}
}  // namespace relay
