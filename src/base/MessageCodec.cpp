#include "MessageCodec.hpp"

#include <openssl/evp.h>

namespace relay {
namespace {
typedef std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>
    CipherContext;

CipherContext newCipherContext() {
  CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_CIPHER_CTX");
  }
  return ctx;
}
}  // namespace

AeadMessageCodec::AeadMessageCodec(const string& _key) {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  if (_key.length() != KEY_BYTES) {
    STFATAL << "Invalid key length: " << _key.length();
  }
  memcpy(key, _key.data(), KEY_BYTES);
}

AeadMessageCodec::~AeadMessageCodec() { sodium_memzero(key, KEY_BYTES); }

shared_ptr<AeadMessageCodec> AeadMessageCodec::fromPassphrase(
    const string& passphrase) {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  string digest(crypto_hash_sha256_BYTES, '\0');
  crypto_hash_sha256((unsigned char*)&digest[0],
                     (const unsigned char*)passphrase.data(),
                     passphrase.length());
  auto codec = make_shared<AeadMessageCodec>(digest);
  sodium_memzero(&digest[0], digest.length());
  return codec;
}

string AeadMessageCodec::encode(const string& plaintext) const {
  string envelope(HEADER_BYTES + plaintext.length(), '\0');
  unsigned char* nonce = (unsigned char*)&envelope[0];
  unsigned char* tag = nonce + NONCE_BYTES;
  unsigned char* ciphertext = tag + TAG_BYTES;
  randombytes_buf(nonce, NONCE_BYTES);

  auto ctx = newCipherContext();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), NULL, NULL, NULL) !=
          1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_BYTES,
                          NULL) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), NULL, NULL, key, nonce) != 1) {
    throw std::runtime_error("Failed to init AES-256-GCM");
  }

  int len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                        (const unsigned char*)plaintext.data(),
                        plaintext.length()) != 1) {
    throw std::runtime_error("Encryption failed");
  }
  int finalLen = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &finalLen) != 1) {
    throw std::runtime_error("Final encryption step failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_BYTES, tag) !=
      1) {
    throw std::runtime_error("Failed to get GCM tag");
  }
  return envelope;
}

string AeadMessageCodec::decode(const string& envelope) const {
  if (envelope.length() < HEADER_BYTES) {
    throw DecodeError(DecodeError::MALFORMED,
                      "Envelope too short: " + to_string(envelope.length()));
  }
  const unsigned char* nonce = (const unsigned char*)envelope.data();
  const unsigned char* tag = nonce + NONCE_BYTES;
  const unsigned char* ciphertext = tag + TAG_BYTES;
  size_t ciphertextLength = envelope.length() - HEADER_BYTES;

  auto ctx = newCipherContext();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), NULL, NULL, NULL) !=
          1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_BYTES,
                          NULL) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), NULL, NULL, key, nonce) != 1) {
    throw std::runtime_error("Failed to init AES-256-GCM");
  }

  string plaintext(ciphertextLength, '\0');
  int len = 0;
  if (ciphertextLength > 0 &&
      EVP_DecryptUpdate(ctx.get(), (unsigned char*)&plaintext[0], &len,
                        ciphertext, ciphertextLength) != 1) {
    throw DecodeError(DecodeError::TAMPER_DETECTED, "Decryption failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_BYTES,
                          (void*)tag) != 1) {
    throw std::runtime_error("Failed to set GCM tag");
  }
  int finalLen = 0;
  unsigned char scratch[16];
  unsigned char* out =
      ciphertextLength > 0 ? (unsigned char*)&plaintext[0] + len : scratch;
  if (EVP_DecryptFinal_ex(ctx.get(), out, &finalLen) != 1) {
    sodium_memzero(&plaintext[0], plaintext.length());
    throw DecodeError(DecodeError::TAMPER_DETECTED,
                      "Authentication tag mismatch");
  }
  plaintext.resize(len + finalLen);
  return plaintext;
}

shared_ptr<MessageCodec> createMessageCodec(const string& codecName,
                                            const string& passphrase) {
  if (codecName == "aead") {
    if (passphrase.empty()) {
      throw std::runtime_error("The aead codec requires a passphrase");
    }
    return AeadMessageCodec::fromPassphrase(passphrase);
  }
  if (codecName == "plaintext") {
    return make_shared<PlaintextMessageCodec>();
  }
  throw std::runtime_error("Unknown codec: " + codecName);
}
}  // namespace relay
