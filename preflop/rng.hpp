#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <stdexcept>
#include <gsl/gsl_rng.h>

namespace preflop {

// mixes a base seed and a stream index into an independent 64 bit seed (splitmix64 finalizer)
inline uint64_t substream_seed(const uint64_t seed, const uint64_t stream) {
  uint64_t z = seed + (stream + 1) * 0x9E3779B97F4A7C15ULL;
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

inline uint64_t entropy_seed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}

class GSLStream {
public:
  explicit GSLStream(const uint64_t seed) : _rng{gsl_rng_alloc(gsl_rng_mt19937), gsl_rng_free} {
    if(!_rng) throw std::runtime_error{"Failed to allocate GSL random number generator."};
    gsl_rng_set(_rng.get(), static_cast<unsigned long>(seed));
  }

  unsigned long uniform_int(const unsigned long n) { return gsl_rng_uniform_int(_rng.get(), n); }

private:
  std::unique_ptr<gsl_rng, decltype(&gsl_rng_free)> _rng;
};

}
