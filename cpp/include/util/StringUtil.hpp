#pragma once

/*
 * Various string utilities
 */
#include <string>
#include <vector>

namespace util {

/*
 * Raises util::CleanException if parse fails.
 */
double atof_safe(const std::string& s);

/*
 * Raises util::CleanException if parse fails.
 */
int atoi_safe(const std::string& s);

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

}  // namespace util

#include "inline/util/StringUtil.inl"
