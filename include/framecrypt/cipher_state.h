#pragma once

#include <framecrypt/key_handle.h>
#include <framecrypt/stats.h>
#include <framecrypt/types.h>

#include <memory>
#include <optional>

namespace framecrypt {

struct KeyEntry
{
  std::shared_ptr<const KeyHandle> key;
  Generation generation = 0;
};

// Everything the worker knows.  The worker holds exactly one of these and
// replaces it wholesale; the functions below never modify their argument, so
// a snapshot taken before an update stays consistent.
//
// Invariant: previous_key, when present, is the entry current_key replaced.
struct CipherState
{
  std::optional<KeyEntry> current_key;
  std::optional<KeyEntry> previous_key;
  bool encryption_enabled = false;
  Statistics stats;
};

// Slides the current key into the previous slot, dropping whatever was there,
// and installs the new key as current.
CipherState update_key(const CipherState& state,
                       std::shared_ptr<const KeyHandle> key,
                       Generation generation);

CipherState with_encryption_enabled(const CipherState& state, bool enabled);
CipherState with_stats(const CipherState& state, Statistics stats);

} // namespace framecrypt
