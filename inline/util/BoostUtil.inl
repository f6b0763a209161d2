#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

#include <format>

namespace boost_util {

namespace program_options {

template <typename StrSeq>
options_description<StrSeq>::options_description(const char* name)
    : full_base_(new base_t(name)), base_(new base_t(name)) {}

template <typename StrSeq>
options_description<StrSeq>::~options_description() {
  // The base_t objects are deliberately leaked. Each visible option's value_semantic is registered
  // in both of them, and boost takes ownership of it in each, so deleting both would double-free.
}

template <typename StrSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq>::add_option(Ts&&... ts) {
  auto out = augment<StrLit>();
  std::string full_name(StrLit.value);
  if (Char != ' ') {
    full_name = std::format("{},{}", full_name, Char);
  }

  out.full_base_->add_options()(full_name.c_str(), ts...);
  out.base_->add_options()(full_name.c_str(), std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq>
template <util::StringLiteral StrLit, typename... Ts>
auto options_description<StrSeq>::add_hidden_option(Ts&&... ts) {
  auto out = augment<StrLit>();
  out.full_base_->add_options()(StrLit.value, std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq>::add_flag(bool* flag, const char* true_help,
                                           const char* false_help) {
  namespace po = boost::program_options;

  auto out = augment<TrueStrLit>().template augment<FalseStrLit>();

  std::string full_true_help = true_help;
  std::string full_false_help = false_help;
  if (*flag) {
    full_true_help += " (no-op)";
  } else {
    full_false_help += " (no-op)";
  }

  const char* true_name = TrueStrLit.value;
  const char* false_name = FalseStrLit.value;

  out.full_base_->add_options()(true_name, po::value(flag)->implicit_value(true)->zero_tokens(),
                                full_true_help.c_str())(
    false_name, po::value(flag)->implicit_value(false)->zero_tokens(), full_false_help.c_str());

  if (*flag) {
    out.base_->add_options()(false_name, po::value(flag)->implicit_value(false)->zero_tokens(),
                             full_false_help.c_str());
  } else {
    out.base_->add_options()(true_name, po::value(flag)->implicit_value(true)->zero_tokens(),
                             full_true_help.c_str());
  }
  return out;
}

template <typename StrSeq>
template <typename StrSeq2>
auto options_description<StrSeq>::add(const options_description<StrSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");

  using OutT = options_description<util::concat_string_literal_sequence_t<StrSeq, StrSeq2>>;

  full_base_->add(*desc.full_base_);
  base_->add(*desc.base_);
  return OutT(full_base_, base_);
}

template <typename StrSeq>
void options_description<StrSeq>::print(std::ostream& s) const {
  if (Settings::help_full) {
    full_base_->print(s);
  } else {
    base_->print(s);
  }
}

template <typename StrSeq>
template <util::StringLiteral StrLit>
auto options_description<StrSeq>::augment() const {
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, StrLit>, "Options name clash!");

  using StrSeq2 =
    util::concat_string_literal_sequence_t<StrSeq, util::StringLiteralSequence<StrLit>>;
  return options_description<StrSeq2>(full_base_, base_);
}

namespace detail {

template <typename T>
struct Wrap {
  const T& operator()(const T& t) const { return t; }
};

template <typename S>
struct Wrap<options_description<S>> {
  const auto& operator()(const options_description<S>& t) const { return t.get(); }
};

template <typename T>
const auto& wrap(const T& t) {
  return Wrap<T>()(t);
}

}  // namespace detail

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(detail::wrap(desc)).run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
