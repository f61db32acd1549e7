#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

namespace settlesim::util {

// splitmix64: fast deterministic mixing / RNG step (Sebastiano Vigna).
//
// Not a cryptographically secure RNG.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Double in [0,1) from the top 53 bits.
inline double u01_from_u64(std::uint64_t x) {
  const std::uint64_t v = x >> 11;
  return static_cast<double>(v) * (1.0 / 9007199254740992.0); // 2^53
}

inline std::uint64_t next_splitmix64(std::uint64_t& state) {
  state = splitmix64(state);
  return state;
}

// Unbiased bounded random integer in [0, bound_exclusive) via rejection sampling.
inline std::uint64_t bounded_u64(std::uint64_t& state, std::uint64_t bound_exclusive) {
  if (bound_exclusive <= 1) return 0;
  const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
  for (;;) {
    const std::uint64_t r = next_splitmix64(state);
    if (r >= threshold) return r % bound_exclusive;
  }
}

// FNV-1a over a string, used to fold settlement ids into RNG seeds.
inline std::uint64_t fnv1a64(const std::string& s) {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (unsigned char c : s) {
    h ^= c;
    h *= 0x100000001b3ULL;
  }
  return h;
}

// Combines seed words so that streams for different (seed, key, time) tuples never share state.
inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b, std::uint64_t c = 0) {
  return splitmix64(splitmix64(a ^ 0x6a09e667f3bcc909ULL) ^ splitmix64(b + 0xbb67ae8584caa73bULL) ^
                    (c * 0x3c6ef372fe94f82bULL));
}

struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  std::uint64_t next_u64() { return next_splitmix64(s); }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Inclusive integer range.
  int range_int(int lo_incl, int hi_incl) {
    int lo = lo_incl;
    int hi = hi_incl;
    if (hi < lo) std::swap(lo, hi);
    const std::uint64_t span = static_cast<std::uint64_t>(hi - lo) + 1ULL;
    return lo + static_cast<int>(bounded_u64(s, span));
  }

  // Index in [0, n).
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded_u64(s, static_cast<std::uint64_t>(n)));
  }

  double range(double lo_incl, double hi_incl) {
    double lo = lo_incl;
    double hi = hi_incl;
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * next_u01();
  }

  bool chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return next_u01() < p;
  }
};

} // namespace settlesim::util
