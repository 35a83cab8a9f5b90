#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace framecrypt {

using bytes = std::vector<uint8_t>;
using input_bytes = std::span<const uint8_t>;
using output_bytes = std::span<uint8_t>;

// Key generations count up without bound; only the low byte is carried in a
// frame, so every comparison against a frame is made modulo 256.
using Generation = uint32_t;
using GenerationTag = uint8_t;

constexpr GenerationTag
generation_tag(Generation generation)
{
  return static_cast<GenerationTag>(generation & 0xff);
}

// Shortest distance between two tags walking either way around the byte
// circle, so 255 and 0 are one step apart.
constexpr unsigned
circular_distance(GenerationTag a, GenerationTag b)
{
  const unsigned diff = a > b ? a - b : b - a;
  return diff <= 128 ? diff : 256 - diff;
}

} // namespace framecrypt
