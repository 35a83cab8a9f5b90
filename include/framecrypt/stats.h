#pragma once

#include <framecrypt/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>

namespace framecrypt {

struct Statistics
{
  uint64_t total_frames = 0;
  uint64_t encrypted_frames = 0;
  uint64_t decrypted_frames = 0;
  uint64_t passthrough_frames = 0;
  uint64_t encryption_errors = 0;
  uint64_t decryption_errors = 0;
  uint64_t dropped_frames = 0;
  double average_encryption_time_ms = 0.0;
  double average_decryption_time_ms = 0.0;
  Generation key_generation = 0;
  bool encryption_enabled = false;

  friend bool operator==(const Statistics& lhs, const Statistics& rhs) = default;
};

// Folds of one outcome into the running statistics.  Each returns a new value
// and leaves its argument alone.
Statistics record_encryption(const Statistics& stats, double elapsed_ms);
Statistics record_decryption(const Statistics& stats, double elapsed_ms);
Statistics record_passthrough(const Statistics& stats);
Statistics record_encryption_error(const Statistics& stats);
Statistics record_decryption_error(const Statistics& stats);
Statistics with_key_generation(const Statistics& stats, Generation generation);
Statistics with_encryption_enabled(const Statistics& stats, bool enabled);

void to_json(nlohmann::json& j, const Statistics& stats);
void from_json(const nlohmann::json& j, Statistics& stats);

} // namespace framecrypt
