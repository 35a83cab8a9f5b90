#include <framecrypt/cipher_state.h>

namespace framecrypt {

CipherState
update_key(const CipherState& state,
           std::shared_ptr<const KeyHandle> key,
           Generation generation)
{
  auto next = state;
  next.previous_key = state.current_key;
  next.current_key = KeyEntry{ std::move(key), generation };
  next.stats = with_key_generation(state.stats, generation);
  return next;
}

CipherState
with_encryption_enabled(const CipherState& state, bool enabled)
{
  auto next = state;
  next.encryption_enabled = enabled;
  next.stats = with_encryption_enabled(state.stats, enabled);
  return next;
}

CipherState
with_stats(const CipherState& state, Statistics stats)
{
  auto next = state;
  next.stats = std::move(stats);
  return next;
}

} // namespace framecrypt
