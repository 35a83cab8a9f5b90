#pragma once

#include <framecrypt/types.h>

#include <mbedtls/cipher.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>

namespace framecrypt {

// An AES-256-GCM key that can only be used, never read.  The key schedule
// lives inside an mbedtls cipher context; the handle keeps no copy of the raw
// bytes and offers no way to export them.
class KeyHandle
{
public:
  static constexpr size_t key_size = 32;
  static constexpr size_t nonce_size = 12;

  // Imports a JSON Web Key of type "oct" holding 32 bytes.  Throws
  // key_import_error if the JWK is malformed or not usable for AES-GCM
  // encryption and decryption.
  static std::shared_ptr<const KeyHandle> import_jwk(const nlohmann::json& jwk);
  static std::shared_ptr<const KeyHandle> import_raw(input_bytes key);

  KeyHandle(const KeyHandle&) = delete;
  KeyHandle& operator=(const KeyHandle&) = delete;

  // Writes ciphertext followed by the tag into ct and returns the used part.
  output_bytes seal(input_bytes nonce,
                    output_bytes ct,
                    input_bytes pt,
                    size_t tag_size) const;

  // Returns std::nullopt if the tag does not verify.
  std::optional<output_bytes> open(input_bytes nonce,
                                   output_bytes pt,
                                   input_bytes ct,
                                   size_t tag_size) const;

protected:
  using scoped_cipher_ctx =
    std::unique_ptr<mbedtls_cipher_context_t, void (*)(mbedtls_cipher_context_t*)>;

  explicit KeyHandle(input_bytes key);

  scoped_cipher_ctx ctx;
  mutable std::mutex ctx_mutex;
};

namespace jwk {

// Wraps raw key bytes the way a key-exchange peer would hand them over.
nlohmann::json from_raw(input_bytes key);

std::string base64url_encode(input_bytes data);
bytes base64url_decode(const std::string& text);

} // namespace jwk

} // namespace framecrypt
