#pragma once

#include <exception>
#include <format>
#include <string>
#include <utility>

namespace util {

/*
 * Like std::runtime_error, but with std::format() mechanics.
 */
class Exception : public std::exception {
 public:
  Exception() : std::exception() {}

  template <typename... Ts>
  Exception(std::format_string<Ts...> fmt, Ts&&... ts) : std::exception() {
    what_ = std::format(fmt, std::forward<Ts>(ts)...);
  }

  char const* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * A variant of util::Exception.
 *
 * Use util::CleanException when the failure is caused by input rather than by a bug in the
 * program: bad cmdline args, a scenario file that does not parse, a payoff parameter set that
 * violates its ordering. The main() of a program catches this exception and prints the message to
 * stderr instead of letting it terminate the process with a core dump.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

}  // namespace util
