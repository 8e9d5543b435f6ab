#ifndef __RELAY_MESSAGE_CODEC__
#define __RELAY_MESSAGE_CODEC__

#include "Headers.hpp"

namespace relay {
/**
 * @brief Raised by MessageCodec::decode when an envelope cannot be opened.
 */
class DecodeError : public std::runtime_error {
 public:
  enum Kind {
    /** @brief Authentication tag did not verify (wrong key or altered bytes). */
    TAMPER_DETECTED,
    /** @brief Envelope is shorter than the fixed header. */
    MALFORMED
  };

  DecodeError(Kind _kind, const string& message)
      : std::runtime_error(message), kind(_kind) {}

  Kind getKind() const { return kind; }

 protected:
  Kind kind;
};

/**
 * @brief Turns plaintext chat payloads into transport-safe envelopes and back.
 *
 * Implementations hold nothing but their key, so a single instance is shared
 * by every connection.
 */
class MessageCodec {
 public:
  virtual ~MessageCodec() {}

  virtual string encode(const string& plaintext) const = 0;

  /**
   * @throws DecodeError when the envelope is malformed or fails verification.
   */
  virtual string decode(const string& envelope) const = 0;

  virtual string name() const = 0;
};

/**
 * @brief AES-256-GCM envelope codec.
 *
 * Envelope layout: bytes [0:16] random nonce, [16:32] authentication tag,
 * [32:] ciphertext. A fresh nonce is drawn for every encode() call.
 */
class AeadMessageCodec : public MessageCodec {
 public:
  static const size_t NONCE_BYTES = 16;
  static const size_t TAG_BYTES = 16;
  static const size_t HEADER_BYTES = NONCE_BYTES + TAG_BYTES;
  static const size_t KEY_BYTES = 32;

  /**
   * @param key Exactly KEY_BYTES bytes of key material.
   */
  explicit AeadMessageCodec(const string& key);
  virtual ~AeadMessageCodec();

  /**
   * @brief Builds a codec whose key is the SHA-256 digest of @p passphrase.
   */
  static shared_ptr<AeadMessageCodec> fromPassphrase(const string& passphrase);

  virtual string encode(const string& plaintext) const;
  virtual string decode(const string& envelope) const;
  virtual string name() const { return "aead"; }

 protected:
  unsigned char key[KEY_BYTES];
};

/**
 * @brief Identity codec for deployments where a secure channel in front of the
 * relay already provides confidentiality.
 */
class PlaintextMessageCodec : public MessageCodec {
 public:
  virtual string encode(const string& plaintext) const { return plaintext; }
  virtual string decode(const string& envelope) const { return envelope; }
  virtual string name() const { return "plaintext"; }
};

/**
 * @brief Creates the codec named in the configuration ("aead" or "plaintext").
 * @throws std::runtime_error for an unknown name or an empty aead passphrase.
 */
shared_ptr<MessageCodec> createMessageCodec(const string& codecName,
                                            const string& passphrase);
}  // namespace relay

#endif  // __RELAY_MESSAGE_CODEC__
