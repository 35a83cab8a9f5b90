#pragma once

#include <framecrypt/types.h>

#include <optional>
#include <stdexcept>
#include <string>

namespace framecrypt {

// Base of everything the cipher reports.  Each failure is local to one frame
// or one message; none of them leaves the worker unusable.
struct cipher_error : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

struct encryption_error : cipher_error
{
  using cipher_error::cipher_error;
};

// The key for the frame's generation was selected but the GCM tag did not
// verify.
struct authentication_error : cipher_error
{
  authentication_error(GenerationTag frame_generation, Generation key_generation);

  const GenerationTag frame_generation;
  const Generation key_generation;
};

// The frame's generation byte is close to the known generations but matches
// neither, so it is ciphertext whose key has already been retired.
struct generation_unrecoverable_error : cipher_error
{
  generation_unrecoverable_error(GenerationTag frame_generation,
                                 Generation current_generation,
                                 std::optional<Generation> previous_generation);

  const GenerationTag frame_generation;
  const Generation current_generation;
  const std::optional<Generation> previous_generation;
};

struct key_import_error : cipher_error
{
  using cipher_error::cipher_error;
};

struct unsupported_tag_length_error : cipher_error
{
  explicit unsupported_tag_length_error(size_t bits);
};

} // namespace framecrypt
