#include <framecrypt/errors.h>
#include <framecrypt/frame_codec.h>

#include <algorithm>

namespace framecrypt {

static size_t
tag_size_for(const TagPolicy& policy)
{
  if (std::holds_alternative<DefaultTagLength>(policy)) {
    return FrameCodec::default_tag_size;
  }

  const auto bits = std::get<ExplicitTagLength>(policy).bits;
  if (bits != FrameCodec::default_tag_size * 8) {
    throw unsupported_tag_length_error(bits);
  }
  return bits / 8;
}

FrameCodec::FrameCodec(TagPolicy tag_policy)
  : _tag_size(tag_size_for(tag_policy))
  , random(std::make_shared<RandomSource>())
{
}

bytes
FrameCodec::encrypt(const KeyHandle& key,
                    Generation generation,
                    input_bytes plaintext) const
{
  auto frame = bytes(generation_size + nonce_size + plaintext.size() + _tag_size);
  auto out = output_bytes(frame);

  out[0] = generation_tag(generation);

  // Nonces are never reused under a key: each frame draws a fresh one
  auto nonce = out.subspan(generation_size, nonce_size);
  random->fill(nonce);

  auto ct = out.subspan(generation_size + nonce_size);
  key.seal(nonce, ct, plaintext, _tag_size);

  return frame;
}

const KeyEntry*
FrameCodec::select_key(const CipherState& state, GenerationTag tag) const
{
  if (state.current_key && tag == generation_tag(state.current_key->generation)) {
    return &*state.current_key;
  }

  if (state.previous_key &&
      tag == generation_tag(state.previous_key->generation)) {
    return &*state.previous_key;
  }

  return nullptr;
}

bool
FrameCodec::near_known_generation(const CipherState& state,
                                  GenerationTag tag) const
{
  auto distance =
    circular_distance(tag, generation_tag(state.current_key->generation));

  if (state.previous_key) {
    distance = std::min(
      distance,
      circular_distance(tag, generation_tag(state.previous_key->generation)));
  }

  return distance <= generation_tolerance;
}

DecryptResult
FrameCodec::decrypt(const CipherState& state, bytes&& frame) const
{
  if (!state.current_key || frame.size() < min_frame_size()) {
    return { std::move(frame), false, std::nullopt };
  }

  const auto in = input_bytes(frame);
  const auto tag = in[0];

  const auto* entry = select_key(state, tag);
  if (entry == nullptr) {
    // A raw frame's first byte is arbitrary data; only a near miss is taken
    // to be a generation we no longer hold.
    if (!near_known_generation(state, tag)) {
      return { std::move(frame), false, std::nullopt };
    }

    auto previous = std::optional<Generation>{};
    if (state.previous_key) {
      previous = state.previous_key->generation;
    }
    throw generation_unrecoverable_error(
      tag, state.current_key->generation, previous);
  }

  const auto nonce = in.subspan(generation_size, nonce_size);
  const auto ct = in.subspan(generation_size + nonce_size);

  auto plaintext = bytes(ct.size() - _tag_size);
  const auto opened = entry->key->open(nonce, plaintext, ct, _tag_size);
  if (!opened) {
    throw authentication_error(tag, entry->generation);
  }

  return { std::move(plaintext), true, entry->generation };
}

} // namespace framecrypt
