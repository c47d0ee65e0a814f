// ============================================================================
// random_source.hpp -- Seeded random source with index-addressed sub-streams
//
// A RandomSource is a seed. Each consumer asks for an engine addressed by
// (stream kind, index); the engine is seeded from all three values, so the
// draws feeding cell `i` or frame `t` never depend on which thread ran first
// or on how many other cells/frames were generated.
// ============================================================================
#pragma once
#include <cstdint>
#include <random>

namespace simcad {

using Engine = std::mt19937_64;

// ============================================================================
// `Stream` enum
// One sub-stream family per consumer of randomness.
// ============================================================================
enum class Stream : std::uint32_t {
  Footprint = 1,
  Spikes    = 2,
  Motion    = 3,
  Noise     = 4,
};

// ============================================================================
// `RandomSource` class
// ============================================================================
class RandomSource {
public:
  static constexpr std::uint64_t kMaxSeed = 0x7fff'ffff'ffff'ffffULL;

  explicit RandomSource(std::uint64_t seed) noexcept : seed_{seed} {}

  /// Draw a fresh seed from the OS entropy source. Kept to 63 bits so it
  /// round-trips through a signed 64-bit config value.
  static std::uint64_t entropy_seed() {
    std::random_device rd;
    const std::uint64_t s = (std::uint64_t(rd()) << 32) | std::uint64_t(rd());
    return s & kMaxSeed;
  }

  [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

  /// Engine for the given stream kind and index.
  /// @param kind  The consumer family (footprints, spikes, motion, noise)
  /// @param index Cell or frame index inside that family
  [[nodiscard]] Engine stream(Stream kind, std::uint64_t index = 0) const {
    std::seed_seq seq{
      static_cast<std::uint32_t>(seed_ & 0xffffffffu),
      static_cast<std::uint32_t>(seed_ >> 32),
      static_cast<std::uint32_t>(kind),
      static_cast<std::uint32_t>(index & 0xffffffffu),
      static_cast<std::uint32_t>(index >> 32)
    };
    return Engine(seq);
  }

private:
  std::uint64_t seed_;
};

} // namespace simcad
