#include <framecrypt/stats.h>

namespace framecrypt {

// Incremental mean over n previous samples
static double
running_average(double average, uint64_t n, double sample)
{
  return (average * static_cast<double>(n) + sample) /
         static_cast<double>(n + 1);
}

Statistics
record_encryption(const Statistics& stats, double elapsed_ms)
{
  auto next = stats;
  next.total_frames += 1;
  next.average_encryption_time_ms = running_average(
    stats.average_encryption_time_ms, stats.encrypted_frames, elapsed_ms);
  next.encrypted_frames += 1;
  return next;
}

Statistics
record_decryption(const Statistics& stats, double elapsed_ms)
{
  auto next = stats;
  next.total_frames += 1;
  next.average_decryption_time_ms = running_average(
    stats.average_decryption_time_ms, stats.decrypted_frames, elapsed_ms);
  next.decrypted_frames += 1;
  return next;
}

Statistics
record_passthrough(const Statistics& stats)
{
  auto next = stats;
  next.total_frames += 1;
  next.passthrough_frames += 1;
  return next;
}

Statistics
record_encryption_error(const Statistics& stats)
{
  auto next = stats;
  next.total_frames += 1;
  next.encryption_errors += 1;
  next.dropped_frames += 1;
  return next;
}

Statistics
record_decryption_error(const Statistics& stats)
{
  auto next = stats;
  next.total_frames += 1;
  next.decryption_errors += 1;
  next.dropped_frames += 1;
  return next;
}

Statistics
with_key_generation(const Statistics& stats, Generation generation)
{
  auto next = stats;
  next.key_generation = generation;
  return next;
}

Statistics
with_encryption_enabled(const Statistics& stats, bool enabled)
{
  auto next = stats;
  next.encryption_enabled = enabled;
  return next;
}

void
to_json(nlohmann::json& j, const Statistics& stats)
{
  j = nlohmann::json{
    { "totalFrames", stats.total_frames },
    { "encryptedFrames", stats.encrypted_frames },
    { "decryptedFrames", stats.decrypted_frames },
    { "passthroughFrames", stats.passthrough_frames },
    { "encryptionErrors", stats.encryption_errors },
    { "decryptionErrors", stats.decryption_errors },
    { "droppedFrames", stats.dropped_frames },
    { "averageEncryptionTimeMs", stats.average_encryption_time_ms },
    { "averageDecryptionTimeMs", stats.average_decryption_time_ms },
    { "keyGeneration", stats.key_generation },
    { "encryptionEnabled", stats.encryption_enabled },
  };
}

void
from_json(const nlohmann::json& j, Statistics& stats)
{
  j.at("totalFrames").get_to(stats.total_frames);
  j.at("encryptedFrames").get_to(stats.encrypted_frames);
  j.at("decryptedFrames").get_to(stats.decrypted_frames);
  j.at("passthroughFrames").get_to(stats.passthrough_frames);
  j.at("encryptionErrors").get_to(stats.encryption_errors);
  j.at("decryptionErrors").get_to(stats.decryption_errors);
  j.at("averageEncryptionTimeMs").get_to(stats.average_encryption_time_ms);
  j.at("averageDecryptionTimeMs").get_to(stats.average_decryption_time_ms);
  j.at("keyGeneration").get_to(stats.key_generation);
  j.at("encryptionEnabled").get_to(stats.encryption_enabled);

  if (j.contains("droppedFrames")) {
    j.at("droppedFrames").get_to(stats.dropped_frames);
  }
}

} // namespace framecrypt
