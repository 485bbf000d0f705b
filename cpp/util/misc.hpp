#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

std::string join(const std::vector<std::string>& items,
                 const std::string& delim);

// Returns a string of length size made of random lowercase hex digits.
std::string random_hex(size_t size);

// Formats a number without trailing zeros, so that 1.0 becomes "1" and 1.5
// becomes "1.5".
std::string format_number(double value);

std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> appendString(std::vector<std::string>& var);
std::function<bool(kj::StringPtr)> setInt(int32_t& var);
std::function<bool(kj::StringPtr)> setInt64(int64_t& var);
std::function<bool(kj::StringPtr)> setDouble(double& var);

}  // namespace util

#endif
