/*
 *  frame_codec.h
 *
 *  Description:
 *      Encoding and decoding of encrypted media frames.  An encrypted frame
 *      is laid out at fixed offsets:
 *
 *          [generation: 1][nonce: 12][ciphertext || GCM tag: >= 16]
 *
 *      The generation byte names the key epoch the frame was sealed under
 *      (modulo 256).  Unencrypted frames share the same transport, so on
 *      decode the codec first decides whether a buffer is ciphertext at all:
 *      buffers that are too short, arrive before any key is loaded, or whose
 *      first byte is far from every known generation are passed through
 *      untouched.
 *
 *  Portability Issues:
 *      None.
 */

#pragma once

#include <framecrypt/cipher_state.h>
#include <framecrypt/random.h>
#include <framecrypt/types.h>

#include <memory>
#include <optional>
#include <variant>

namespace framecrypt {

// The AES-GCM default, 128 bits
struct DefaultTagLength
{};

// The 128-bit tag length stated explicitly; nothing shorter is accepted, so
// the frame layout is the same under both policies
struct ExplicitTagLength
{
  size_t bits = 128;
};

using TagPolicy = std::variant<DefaultTagLength, ExplicitTagLength>;

struct DecryptResult
{
  bytes data;
  bool was_encrypted = false;
  std::optional<Generation> used_generation;
};

class FrameCodec
{
public:
  static constexpr size_t generation_size = 1;
  static constexpr size_t nonce_size = KeyHandle::nonce_size;
  static constexpr size_t default_tag_size = 16;

  // A frame tag this many generations (or fewer) away from a known key is
  // treated as ciphertext; further away it is taken to be raw frame data.
  static constexpr unsigned generation_tolerance = 5;

  explicit FrameCodec(TagPolicy tag_policy = DefaultTagLength{});

  size_t tag_size() const { return _tag_size; }

  // Header, nonce, tag and at least one byte of payload
  size_t min_frame_size() const
  {
    return generation_size + nonce_size + _tag_size + 1;
  }

  bytes encrypt(const KeyHandle& key,
                Generation generation,
                input_bytes plaintext) const;

  // Takes ownership of the frame.  On passthrough the same buffer comes back
  // in the result.  Throws generation_unrecoverable_error or
  // authentication_error for frames that are ciphertext but cannot be opened.
  DecryptResult decrypt(const CipherState& state, bytes&& frame) const;

private:
  const KeyEntry* select_key(const CipherState& state, GenerationTag tag) const;
  bool near_known_generation(const CipherState& state, GenerationTag tag) const;

  size_t _tag_size;
  std::shared_ptr<RandomSource> random;
};

} // namespace framecrypt
