#ifndef UTIL_VERSION_HPP
#define UTIL_VERSION_HPP
#include <string>

namespace util {
static const std::string version = "0.4.1";
// kj::MainBuilder keeps a pointer to its version string.
static const std::string version_banner = "audiofetch (" + version + ")";
}  // namespace util

#endif
