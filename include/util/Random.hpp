#pragma once

#include <concepts>
#include <cstdint>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * Unlike a process-global generator, every function here takes the std::mt19937 to draw from as
 * its first argument. Each simulated game owns its own prng, so that games can run on any thread
 * and any game can be replayed from its seed alone.
 *
 * To add a cmdline option to set the base seed, do:
 *
 * util::Random::Params random_params;
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description raw_desc("General options");
 * auto desc = raw_desc.add(random_params.make_options_description());
 * po2::parse_args(desc, ac, av);
 *
 * std::mt19937 prng = util::Random::make_prng(random_params.seed);
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    uint64_t seed = 0;
  };

  /*
   * Returns a prng seeded with all 64 bits of seed. A seed of 0 means "pick one": a seed is drawn
   * from std::random_device instead.
   */
  static std::mt19937 make_prng(uint64_t seed);

  // Returns seed itself if nonzero, otherwise a seed drawn from std::random_device.
  static uint64_t resolve_seed(uint64_t seed);

  /*
   * Seed for the index'th member of a batch that shares base_seed. Distinct indices give distinct
   * seeds, and the mapping is stable across runs and platforms.
   */
  static uint64_t derive_seed(uint64_t base_seed, uint64_t index);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * T and U should be integral types, and lower must be less than upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  // Produces a random real value in the range [left, right).
  template <typename FloatType>
  static FloatType uniform_real(std::mt19937& prng, FloatType left, FloatType right);

  /*
   * Produces a sample from the normal distribution with the given mean and standard deviation.
   * A stddev of zero returns mean without consuming randomness.
   */
  template <typename RealType>
  static RealType normal(std::mt19937& prng, RealType mean, RealType stddev);

  // Returns true with probability p. Always consumes exactly one uniform draw.
  static bool bernoulli(std::mt19937& prng, double p);
};

}  // namespace util

#include "inline/util/Random.inl"
