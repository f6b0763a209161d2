#pragma once

/*
 * Various string utilities
 */
#include <string>
#include <vector>

namespace util {

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

std::string to_lower(const std::string& s);

// Replaces every occurrence of each character in from with to.
std::string replace_chars(const std::string& s, const char* from, char to);

// "x and y"
// "x, y, and z"  (oxford_comma = true)
// "x, y and z" (oxford_comma = false)
std::string grammatically_join(const std::vector<std::string>& items,
                               const std::string& conjunction, bool oxford_comma = true);

}  // namespace util

#include "inline/util/StringUtil.inl"
