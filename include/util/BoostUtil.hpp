#pragma once

#include "util/CppUtil.hpp"

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <format>
#include <ostream>
#include <string>

namespace boost_util {

/*
 * Writes jv to os with two-space indentation, one object member or array element per line.
 */
void pretty_print(std::ostream& os, boost::json::value const& jv, std::string* indent = nullptr);

// Same as pretty_print(), but returns the result as a string.
std::string pretty_print(boost::json::value const& jv);

void write_str_to_file(const std::string& str, const boost::filesystem::path& filename);

// Throws util::CleanException if the file cannot be read or does not parse as JSON.
boost::json::value read_json_file(const boost::filesystem::path& filename);

namespace program_options {

struct Settings {
  static inline bool help_full = false;
};

/*
 * A thin wrapper around boost::program_options::options_description. Option names are passed as
 * template arguments, so that two components registering the same option name fail to compile
 * instead of failing at runtime.
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"foo", 'f'>(...)
 *     .add_option<"bar">(...)
 *     ;
 *
 * Hidden options are registered in the full description only, and are shown by --help-full.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using base_t = boost::program_options::options_description;

  options_description(const char* name);
  ~options_description();

  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  template <util::StringLiteral StrLit, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo style options writing to *flag. Only the one that changes the
   * current value of *flag is shown by --help.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  template <typename StrSeq2>
  auto add(const options_description<StrSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return *full_base_; }

 private:
  options_description(base_t* full_base, base_t* base) : full_base_(full_base), base_(base) {}

  template <util::StringLiteral StrLit>
  auto augment() const;

  template <typename>
  friend class boost_util::program_options::options_description;

  base_t* full_base_;  // includes hidden options
  base_t* base_;       // excludes hidden options
};

/*
 * Parses the cmdline args in ts against desc, which is either a boost or a boost_util
 * options_description. Parse errors are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
