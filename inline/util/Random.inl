#include "util/BoostUtil.hpp"
#include "util/Random.hpp"

#include <stdexcept>
#include <type_traits>

namespace util {

inline auto Random::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Random options");

  return desc.template add_option<"seed", 's'>(
    po::value<uint64_t>(&seed)->default_value(seed),
    "base random seed (default: 0 means seed from std::random_device)");
}

inline std::mt19937 Random::make_prng(uint64_t seed) {
  uint64_t s = resolve_seed(seed);
  std::seed_seq seq{static_cast<uint32_t>(s), static_cast<uint32_t>(s >> 32)};
  return std::mt19937(seq);
}

inline uint64_t Random::resolve_seed(uint64_t seed) {
  if (seed) return seed;
  std::random_device rd;
  uint64_t s = (uint64_t(rd()) << 32) | rd();
  return s ? s : 1;
}

inline uint64_t Random::derive_seed(uint64_t base_seed, uint64_t index) {
  // splitmix64 finalizer over (base, index)
  uint64_t z = base_seed + 0x9e3779b97f4a7c15ULL * (index + 1);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  z = z ^ (z >> 31);
  return z ? z : 1;
}

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  if (lower >= upper) {
    throw std::runtime_error("Random::uniform_sample() - invalid range");
  }
  using V = std::common_type_t<T, U>;
  std::uniform_int_distribution<V> dist{(V)lower, (V)(upper - 1)};
  return dist(prng);
}

template <typename FloatType>
FloatType Random::uniform_real(std::mt19937& prng, FloatType left, FloatType right) {
  if (left >= right) {
    throw std::runtime_error("Random::uniform_real() - invalid range");
  }
  std::uniform_real_distribution<FloatType> dist(left, right);
  return dist(prng);
}

template <typename RealType>
RealType Random::normal(std::mt19937& prng, RealType mean, RealType stddev) {
  if (stddev < 0) {
    throw std::runtime_error("Random::normal() - negative stddev");
  }
  if (stddev == 0) return mean;
  std::normal_distribution<RealType> dist(mean, stddev);
  return dist(prng);
}

inline bool Random::bernoulli(std::mt19937& prng, double p) {
  return uniform_real<double>(prng, 0.0, 1.0) < p;
}

}  // namespace util
