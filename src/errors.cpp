#include <framecrypt/errors.h>

namespace framecrypt {

static std::string
describe_previous(const std::optional<Generation>& previous_generation)
{
  if (!previous_generation) {
    return "none";
  }
  return std::to_string(*previous_generation);
}

authentication_error::authentication_error(GenerationTag frame_generation,
                                           Generation key_generation)
  : cipher_error("Frame authentication failed (frameGen=" +
                 std::to_string(frame_generation) +
                 ", usedGen=" + std::to_string(key_generation) + ")")
  , frame_generation(frame_generation)
  , key_generation(key_generation)
{
}

generation_unrecoverable_error::generation_unrecoverable_error(
  GenerationTag frame_generation,
  Generation current_generation,
  std::optional<Generation> previous_generation)
  : cipher_error("No matching key for frame generation " +
                 std::to_string(frame_generation) +
                 " (current=" + std::to_string(current_generation) +
                 ", previous=" + describe_previous(previous_generation) + ")")
  , frame_generation(frame_generation)
  , current_generation(current_generation)
  , previous_generation(previous_generation)
{
}

unsupported_tag_length_error::unsupported_tag_length_error(size_t bits)
  : cipher_error("Unsupported AES-GCM tag length: " + std::to_string(bits) +
                 " bits")
{
}

} // namespace framecrypt
