#pragma once

#include <cstdint>

namespace colonia::util {

// splitmix64 step. Deterministic across platforms; not cryptographic.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Small seeded generator used for combat so that a replayed action sequence
// produces the same outcomes on every host.
class HashRng {
 public:
  explicit HashRng(std::uint64_t seed) : state_(seed) {}

  std::uint64_t next_u64() {
    state_ = splitmix64(state_);
    return state_;
  }

  // Uniform in [0, bound). Rejection sampling avoids modulo bias.
  std::uint64_t below(std::uint64_t bound) {
    if (bound <= 1) return 0;
    const std::uint64_t threshold = (0 - bound) % bound;
    for (;;) {
      const std::uint64_t r = next_u64();
      if (r >= threshold) return r % bound;
    }
  }

  std::uint64_t state() const { return state_; }

 private:
  std::uint64_t state_;
};

} // namespace colonia::util
