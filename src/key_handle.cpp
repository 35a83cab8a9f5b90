#include <framecrypt/errors.h>
#include <framecrypt/key_handle.h>

#include <mbedtls/base64.h>
#include <mbedtls/platform_util.h>

#include <algorithm>

namespace framecrypt {

static void
free_cipher_ctx(mbedtls_cipher_context_t* ctx)
{
  mbedtls_cipher_free(ctx);
  delete ctx;
}

KeyHandle::KeyHandle(input_bytes key)
  : ctx(new mbedtls_cipher_context_t(), free_cipher_ctx)
{
  if (key.size() != key_size) {
    throw key_import_error("AES-256-GCM key must be 32 bytes, got " +
                           std::to_string(key.size()));
  }

  mbedtls_cipher_init(ctx.get());
  const auto* cipher = mbedtls_cipher_info_from_type(MBEDTLS_CIPHER_AES_256_GCM);
  if (cipher == nullptr) {
    throw key_import_error("AES-256-GCM is not available");
  }

  const auto setup = mbedtls_cipher_setup(ctx.get(), cipher);
  if (setup != 0) {
    throw key_import_error("Failed to setup cipher context");
  }

  // GCM only ever runs the block cipher forward, for sealing and opening
  const auto keyed = mbedtls_cipher_setkey(
    ctx.get(), key.data(), static_cast<int>(key.size() * 8), MBEDTLS_ENCRYPT);
  if (keyed != 0) {
    throw key_import_error("Failed to set key");
  }
}

std::shared_ptr<const KeyHandle>
KeyHandle::import_raw(input_bytes key)
{
  // NB: std::make_shared cannot access the non-public constructor
  return std::shared_ptr<const KeyHandle>(new KeyHandle(key));
}

std::shared_ptr<const KeyHandle>
KeyHandle::import_jwk(const nlohmann::json& jwk)
{
  if (!jwk.is_object()) {
    throw key_import_error("JWK must be a JSON object");
  }

  const auto kty = jwk.find("kty");
  if (kty == jwk.end() || *kty != "oct") {
    throw key_import_error("JWK key type must be \"oct\"");
  }

  if (jwk.contains("alg") && jwk.at("alg") != "A256GCM") {
    throw key_import_error("JWK algorithm must be A256GCM");
  }

  if (jwk.contains("key_ops")) {
    const auto& ops = jwk.at("key_ops");
    if (!ops.is_array()) {
      throw key_import_error("JWK key_ops must be an array");
    }

    const auto allows = [&](const char* op) {
      return std::find(ops.begin(), ops.end(), op) != ops.end();
    };
    if (!allows("encrypt") || !allows("decrypt")) {
      throw key_import_error("JWK key_ops must allow encrypt and decrypt");
    }
  }

  const auto k = jwk.find("k");
  if (k == jwk.end() || !k->is_string()) {
    throw key_import_error("JWK is missing the \"k\" member");
  }

  auto raw = jwk::base64url_decode(k->get<std::string>());
  try {
    auto handle = import_raw(raw);
    mbedtls_platform_zeroize(raw.data(), raw.size());
    return handle;
  } catch (...) {
    mbedtls_platform_zeroize(raw.data(), raw.size());
    throw;
  }
}

output_bytes
KeyHandle::seal(input_bytes nonce,
                output_bytes ct,
                input_bytes pt,
                size_t tag_size) const
{
  if (ct.size() < pt.size() + tag_size) {
    throw encryption_error("Ciphertext buffer too small");
  }

  const auto _ = std::lock_guard<std::mutex>(ctx_mutex);

  std::size_t outlen = 0;
  const int crypt = mbedtls_cipher_auth_encrypt_ext(ctx.get(),
                                                    nonce.data(),
                                                    nonce.size(),
                                                    nullptr,
                                                    0,
                                                    pt.data(),
                                                    pt.size(),
                                                    ct.data(),
                                                    ct.size(),
                                                    &outlen,
                                                    tag_size);
  if (crypt != 0) {
    throw encryption_error("Failed to encrypt (mbedtls error " +
                           std::to_string(crypt) + ")");
  }

  return ct.subspan(0, pt.size() + tag_size);
}

std::optional<output_bytes>
KeyHandle::open(input_bytes nonce,
                output_bytes pt,
                input_bytes ct,
                size_t tag_size) const
{
  if (ct.size() < tag_size) {
    throw cipher_error("Ciphertext buffer too small");
  }

  const auto inner_ct_size = ct.size() - tag_size;
  if (pt.size() < inner_ct_size) {
    throw cipher_error("Plaintext buffer too small");
  }

  const auto _ = std::lock_guard<std::mutex>(ctx_mutex);

  std::size_t outlen = 0;
  const int decrypt = mbedtls_cipher_auth_decrypt_ext(ctx.get(),
                                                      nonce.data(),
                                                      nonce.size(),
                                                      nullptr,
                                                      0,
                                                      ct.data(),
                                                      ct.size(),
                                                      pt.data(),
                                                      pt.size(),
                                                      &outlen,
                                                      tag_size);
  if (decrypt == MBEDTLS_ERR_CIPHER_AUTH_FAILED) {
    return std::nullopt;
  }

  if (decrypt != 0) {
    throw cipher_error("Failed to decrypt (mbedtls error " +
                       std::to_string(decrypt) + ")");
  }

  return pt.subspan(0, inner_ct_size);
}

namespace jwk {

nlohmann::json
from_raw(input_bytes key)
{
  return {
    { "kty", "oct" },
    { "k", base64url_encode(key) },
    { "alg", "A256GCM" },
    { "ext", false },
    { "key_ops", nlohmann::json::array({ "encrypt", "decrypt" }) },
  };
}

std::string
base64url_encode(input_bytes data)
{
  std::size_t olen = 0;
  mbedtls_base64_encode(nullptr, 0, &olen, data.data(), data.size());

  auto out = std::string(olen, '\0');
  auto* dst = reinterpret_cast<unsigned char*>(out.data());
  if (mbedtls_base64_encode(dst, out.size(), &olen, data.data(), data.size()) !=
      0) {
    throw cipher_error("Failed to base64 encode");
  }
  out.resize(olen);

  // RFC 7515 base64url: URL-safe alphabet, no padding
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  out.erase(std::find(out.begin(), out.end(), '='), out.end());
  return out;
}

bytes
base64url_decode(const std::string& text)
{
  auto padded = text;
  std::replace(padded.begin(), padded.end(), '-', '+');
  std::replace(padded.begin(), padded.end(), '_', '/');
  while (padded.size() % 4 != 0) {
    padded.push_back('=');
  }

  const auto* src = reinterpret_cast<const unsigned char*>(padded.data());

  std::size_t olen = 0;
  const auto sized = mbedtls_base64_decode(nullptr, 0, &olen, src, padded.size());
  if (sized == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
    throw key_import_error("Invalid base64url key data");
  }

  auto out = bytes(olen);
  if (mbedtls_base64_decode(out.data(), out.size(), &olen, src, padded.size()) !=
      0) {
    throw key_import_error("Invalid base64url key data");
  }
  out.resize(olen);
  return out;
}

} // namespace jwk

} // namespace framecrypt
