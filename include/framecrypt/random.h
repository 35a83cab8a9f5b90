#pragma once

#include <framecrypt/types.h>

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>

#include <mutex>

namespace framecrypt {

// CTR-DRBG seeded from the platform entropy source; used for frame nonces.
class RandomSource
{
public:
  RandomSource();
  ~RandomSource();

  RandomSource(const RandomSource&) = delete;
  RandomSource& operator=(const RandomSource&) = delete;

  void fill(output_bytes out);

private:
  mbedtls_entropy_context entropy;
  mbedtls_ctr_drbg_context ctr_drbg;
  std::mutex drbg_mutex;
};

} // namespace framecrypt
