#pragma once

#include <algorithm>
#include <cstddef>

/*
 * Marks the arguments of a macro as used without evaluating them. The logging macros rely on this
 * so that arguments of compiled-out log statements do not trigger unused-variable warnings.
 */
#define USE_UNEVALUATED(...) \
  static_cast<void>(sizeof(::util::detail::use_unevaluated(__VA_ARGS__), 0))

namespace util {

namespace detail {

template <typename... Ts>
constexpr void use_unevaluated(const Ts&...) {}

}  // namespace detail

template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }

  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    // strcmp() is not required to be constexpr, so compare by hand.
    if (N != M) return false;
    for (size_t i = 0; i < N; ++i) {
      if (value[i] != other.value[i]) return false;
    }
    return true;
  }

  char value[N];
};

template <StringLiteral...>
struct StringLiteralSequence {};

/*
 * true: util::string_literal_sequence_contains_v<StringLiteralSequence<"a", "b">, "b">
 * false: util::string_literal_sequence_contains_v<StringLiteralSequence<"a", "b">, "c">
 */
template <typename T, StringLiteral S>
struct string_literal_sequence_contains {
  static constexpr bool value = false;
};
template <StringLiteral I, StringLiteral... Is, StringLiteral S>
struct string_literal_sequence_contains<StringLiteralSequence<I, Is...>, S> {
  static constexpr bool value =
    (I == S) || string_literal_sequence_contains<StringLiteralSequence<Is...>, S>::value;
};
template <typename T, StringLiteral S>
inline constexpr bool string_literal_sequence_contains_v =
  string_literal_sequence_contains<T, S>::value;

template <typename T, typename U>
struct concat_string_literal_sequence {};
template <StringLiteral... S1, StringLiteral... S2>
struct concat_string_literal_sequence<StringLiteralSequence<S1...>, StringLiteralSequence<S2...>> {
  using type = StringLiteralSequence<S1..., S2...>;
};
template <typename T, typename U>
using concat_string_literal_sequence_t = concat_string_literal_sequence<T, U>::type;

template <typename T, typename U>
struct no_overlap {
  static constexpr bool value = true;
};
template <typename T, StringLiteral S, StringLiteral... Ss>
struct no_overlap<T, StringLiteralSequence<S, Ss...>> {
  static constexpr bool value = !string_literal_sequence_contains_v<T, S> &&
                                no_overlap<T, StringLiteralSequence<Ss...>>::value;
};
template <typename T, typename U>
inline constexpr bool no_overlap_v = no_overlap<T, U>::value;

}  // namespace util
