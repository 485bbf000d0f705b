#include "util/misc.hpp"

#include <iomanip>
#include <sstream>
#include <random>

namespace util {

std::string join(const std::vector<std::string>& items,
                 const std::string& delim) {
  std::string result;
  for (size_t i = 0; i < items.size(); i++) {
    if (i > 0) result += delim;
    result += items[i];
  }
  return result;
}

std::string random_hex(size_t size) {
  static const constexpr char* digits = "0123456789abcdef";
  thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_int_distribution<int> dist(0, 15);
  std::string result(size, '0');
  for (char& c : result) c = digits[dist(gen)];
  return result;
}

std::string format_number(double value) {
  std::ostringstream os;
  os << std::setprecision(15) << value;
  return os.str();
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> appendString(
    std::vector<std::string>& var) {
  return [&var](kj::StringPtr p) {
    var.emplace_back(p.cStr());
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int32_t& var) {
  return [&var](kj::StringPtr p) {
    var = std::stoi(std::string(p.cStr()));
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt64(int64_t& var) {
  return [&var](kj::StringPtr p) {
    var = std::stoll(std::string(p.cStr()));
    return true;
  };
};

std::function<bool(kj::StringPtr)> setDouble(double& var) {
  return [&var](kj::StringPtr p) {
    var = std::stod(std::string(p.cStr()));
    return true;
  };
};

}  // namespace util
