#ifndef CLI_MANIFEST_HPP
#define CLI_MANIFEST_HPP

#include <string>
#include <vector>

#include "core/task.hpp"

namespace cli {

// Parses a download manifest. Each non empty line not starting with '#' is
//
//   <id> <priority> <resource> <source> [key=value | dependency]...
//
// where keys are dest, size and sha256. Returns false and sets *error on the
// first malformed line.
bool ParseManifest(const std::string& contents, std::vector<core::Task>* tasks,
                   std::string* error);

// Same as ParseManifest, reading the manifest from path.
bool LoadManifest(const std::string& path, std::vector<core::Task>* tasks,
                  std::string* error);

}  // namespace cli

#endif
