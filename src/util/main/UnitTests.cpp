#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

TEST(Random, make_prng_is_reproducible) {
  std::mt19937 prng1 = util::Random::make_prng(42);
  std::mt19937 prng2 = util::Random::make_prng(42);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(prng1(), prng2());
  }
}

TEST(Random, make_prng_uses_high_seed_bits) {
  std::mt19937 low = util::Random::make_prng(1);
  std::mt19937 high = util::Random::make_prng((uint64_t(1) << 32) | 1);
  EXPECT_NE(low, high);

  int same_draws = 0;
  int same_flips = 0;
  for (int i = 0; i < 1000; ++i) {
    if (util::Random::uniform_sample(low, 0, 1000000) ==
        util::Random::uniform_sample(high, 0, 1000000)) {
      same_draws++;
    }
    if (util::Random::bernoulli(low, 0.5) == util::Random::bernoulli(high, 0.5)) same_flips++;
  }
  EXPECT_LT(same_draws, 10);
  EXPECT_LT(same_flips, 600);
}

TEST(Random, resolve_seed) {
  EXPECT_EQ(util::Random::resolve_seed(17), 17u);
  EXPECT_NE(util::Random::resolve_seed(0), 0u);
}

TEST(Random, derive_seed) {
  std::set<uint64_t> seeds;
  for (uint64_t i = 0; i < 1000; ++i) {
    seeds.insert(util::Random::derive_seed(12345, i));
  }
  EXPECT_EQ(seeds.size(), 1000u);

  EXPECT_EQ(util::Random::derive_seed(12345, 7), util::Random::derive_seed(12345, 7));
  EXPECT_NE(util::Random::derive_seed(12345, 7), util::Random::derive_seed(12346, 7));
}

TEST(Random, uniform_sample) {
  std::mt19937 prng = util::Random::make_prng(1);
  std::vector<int> counts(5, 0);

  constexpr int N = 50000;
  for (int i = 0; i < N; ++i) {
    int x = util::Random::uniform_sample(prng, 10, 15);
    ASSERT_GE(x, 10);
    ASSERT_LT(x, 15);
    counts[x - 10]++;
  }
  for (int c : counts) {
    EXPECT_NEAR(c * 1.0 / N, 0.2, 0.01);
  }

  EXPECT_THROW(util::Random::uniform_sample(prng, 3, 3), std::runtime_error);
}

TEST(Random, normal) {
  std::mt19937 prng = util::Random::make_prng(2);

  constexpr int N = 50000;
  double sum = 0;
  double sum_sq = 0;
  for (int i = 0; i < N; ++i) {
    double x = util::Random::normal(prng, 3.0, 2.0);
    sum += x;
    sum_sq += x * x;
  }
  double mean = sum / N;
  double stddev = std::sqrt(sum_sq / N - mean * mean);
  EXPECT_NEAR(mean, 3.0, 0.05);
  EXPECT_NEAR(stddev, 2.0, 0.05);
}

TEST(Random, normal_zero_stddev) {
  std::mt19937 prng = util::Random::make_prng(3);
  std::mt19937 untouched = prng;

  EXPECT_EQ(util::Random::normal(prng, 7.5, 0.0), 7.5);
  EXPECT_EQ(prng, untouched);
}

TEST(Random, bernoulli) {
  std::mt19937 prng = util::Random::make_prng(4);

  constexpr int N = 50000;
  int hits = 0;
  for (int i = 0; i < N; ++i) {
    if (util::Random::bernoulli(prng, 0.08)) hits++;
  }
  EXPECT_NEAR(hits * 1.0 / N, 0.08, 0.005);

  // always exactly one draw, whatever p is
  std::mt19937 a = util::Random::make_prng(5);
  std::mt19937 b = util::Random::make_prng(5);
  util::Random::bernoulli(a, 0.0);
  b.discard(2);  // uniform_real_distribution<double> consumes two 32-bit words
  EXPECT_EQ(a, b);
}

TEST(StringUtil, split) {
  std::vector<std::string> result1 = util::split("a,b,c", ",");
  std::vector<std::string> result2 = util::split(" a \tb   c ");
  std::vector<std::string> result3 = util::split("a,,b", ",");

  EXPECT_EQ(result1, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(result2, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(result3, (std::vector<std::string>{"a", "", "b"}));
  EXPECT_TRUE(util::split("   ").empty());
}

TEST(StringUtil, to_lower) {
  EXPECT_EQ(util::to_lower("Prisoners_Dilemma"), "prisoners_dilemma");
  EXPECT_EQ(util::to_lower("PD"), "pd");
  EXPECT_EQ(util::to_lower(""), "");
}

TEST(StringUtil, replace_chars) {
  EXPECT_EQ(util::replace_chars("stag-hunt game", "- ", '_'), "stag_hunt_game");
  EXPECT_EQ(util::replace_chars("chicken", "-", '_'), "chicken");
}

TEST(StringUtil, grammatically_join) {
  EXPECT_EQ(util::grammatically_join({}, "and"), "");
  EXPECT_EQ(util::grammatically_join({"a"}, "and"), "a");
  EXPECT_EQ(util::grammatically_join({"a", "b"}, "and"), "a and b");
  EXPECT_EQ(util::grammatically_join({"a", "b"}, "and", false), "a and b");
  EXPECT_EQ(util::grammatically_join({"a", "b", "c"}, "or"), "a, b, or c");
  EXPECT_EQ(util::grammatically_join({"a", "b", "c"}, "or", false), "a, b or c");
}

TEST(BoostUtil, pretty_print) {
  boost::json::object obj;
  obj["b"] = 1;
  obj["a"] = boost::json::array{1, 2};
  obj["c"] = boost::json::object{};

  std::string expected =
    "{\n"
    "  \"a\": [1, 2],\n"
    "  \"b\": 1,\n"
    "  \"c\": {}\n"
    "}";
  EXPECT_EQ(boost_util::pretty_print(obj), expected);
  EXPECT_EQ(boost_util::pretty_print(boost::json::value(-0.0)), "0");
}

TEST(BoostUtil, read_json_file_missing) {
  EXPECT_THROW(boost_util::read_json_file("/nonexistent/path/to/file.json"),
               util::CleanException);
}

TEST(BoostUtil, write_and_read_json_file) {
  boost::filesystem::path path =
    boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("%%%%-%%%%.json");

  boost_util::write_str_to_file("{\"x\": [1, 2, 3]}", path);
  boost::json::value jv = boost_util::read_json_file(path);
  EXPECT_EQ(jv.at("x").as_array().size(), 3u);

  boost_util::write_str_to_file("{\"x\": ", path);
  EXPECT_THROW(boost_util::read_json_file(path), util::CleanException);

  boost::filesystem::remove(path);
}

TEST(LoggingUtil, parse_level) {
  EXPECT_EQ(util::Logging::parse_level("debug"), spdlog::level::debug);
  EXPECT_EQ(util::Logging::parse_level("warn"), spdlog::level::warn);
  EXPECT_EQ(util::Logging::parse_level("error"), spdlog::level::err);
  EXPECT_THROW(util::Logging::parse_level("verbose"), util::CleanException);
}

TEST(Exception, format) {
  util::Exception e("turn {} of {}", 3, 12);
  EXPECT_STREQ(e.what(), "turn 3 of 12");

  util::CleanException c("bad tag \"{}\"", "xyz");
  EXPECT_STREQ(c.what(), "bad tag \"xyz\"");
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
