#include "util/misc.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string trim(const std::string& s) {
  static const constexpr char* spaces = " \t\r\n";
  size_t begin = s.find_first_not_of(spaces);
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(spaces);
  return s.substr(begin, end - begin + 1);
}

namespace {
bool parseSigned(kj::StringPtr p, int64_t min, int64_t max, int64_t* out) {
  if (p.size() == 0) return false;
  char* end = nullptr;
  errno = 0;
  long long val = std::strtoll(p.cStr(), &end, 10);
  if (errno != 0 || *end != '\0') return false;
  if (val < min || val > max) return false;
  *out = val;
  return true;
}

bool parseUnsigned(kj::StringPtr p, uint64_t max, uint64_t* out) {
  if (p.size() == 0 || p[0] == '-') return false;
  char* end = nullptr;
  errno = 0;
  unsigned long long val = std::strtoull(p.cStr(), &end, 10);
  if (errno != 0 || *end != '\0') return false;
  if (val > max) return false;
  *out = val;
  return true;
}
}  // namespace

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string* var) {
  return [var](kj::StringPtr p) {
    *var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int32_t* var) {
  return [var](kj::StringPtr p) {
    int64_t val;
    if (!parseSigned(p, std::numeric_limits<int32_t>::min(),
                     std::numeric_limits<int32_t>::max(), &val)) {
      return false;
    }
    *var = static_cast<int32_t>(val);
    return true;
  };
};

std::function<bool(kj::StringPtr)> setUint(uint32_t* var) {
  return [var](kj::StringPtr p) {
    uint64_t val;
    if (!parseUnsigned(p, std::numeric_limits<uint32_t>::max(), &val)) {
      return false;
    }
    *var = static_cast<uint32_t>(val);
    return true;
  };
};

std::function<bool(kj::StringPtr)> setUint64(uint64_t* var) {
  return [var](kj::StringPtr p) {
    return parseUnsigned(p, std::numeric_limits<uint64_t>::max(), var);
  };
};

std::function<bool(kj::StringPtr)> setDouble(double* var) {
  return [var](kj::StringPtr p) {
    if (p.size() == 0) return false;
    char* end = nullptr;
    errno = 0;
    double val = std::strtod(p.cStr(), &end);
    if (errno != 0 || *end != '\0') return false;
    *var = val;
    return true;
  };
};

}  // namespace util
