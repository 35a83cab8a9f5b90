#include <framecrypt/errors.h>
#include <framecrypt/random.h>

#include <string>

namespace framecrypt {

static const auto personalization = std::string("framecrypt frame nonce");

RandomSource::RandomSource()
{
  mbedtls_entropy_init(&entropy);
  mbedtls_ctr_drbg_init(&ctr_drbg);

  const auto seeded = mbedtls_ctr_drbg_seed(
    &ctr_drbg,
    mbedtls_entropy_func,
    &entropy,
    reinterpret_cast<const unsigned char*>(personalization.data()),
    personalization.size());
  if (seeded != 0) {
    mbedtls_ctr_drbg_free(&ctr_drbg);
    mbedtls_entropy_free(&entropy);
    throw cipher_error("Failed to seed random number generator");
  }
}

RandomSource::~RandomSource()
{
  mbedtls_ctr_drbg_free(&ctr_drbg);
  mbedtls_entropy_free(&entropy);
}

void
RandomSource::fill(output_bytes out)
{
  const auto _ = std::lock_guard<std::mutex>(drbg_mutex);
  const auto generated = mbedtls_ctr_drbg_random(&ctr_drbg, out.data(), out.size());
  if (generated != 0) {
    throw encryption_error("Failed to generate random bytes");
  }
}

} // namespace framecrypt
