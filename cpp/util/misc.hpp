#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Removes leading and trailing whitespace.
std::string trim(const std::string& s);

// Option setters for kj::MainBuilder. Numeric setters reject malformed or
// out of range values instead of throwing.
std::function<bool()> setBool(bool* var);
std::function<bool(kj::StringPtr)> setString(std::string* var);
std::function<bool(kj::StringPtr)> setInt(int32_t* var);
std::function<bool(kj::StringPtr)> setUint(uint32_t* var);
std::function<bool(kj::StringPtr)> setUint64(uint64_t* var);
std::function<bool(kj::StringPtr)> setDouble(double* var);

}  // namespace util
#endif
