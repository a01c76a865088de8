#include "cli/manifest.hpp"

#include <sstream>
#include <system_error>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace cli {

namespace {
bool ParseLine(const std::vector<std::string>& fields, core::Task* task,
               std::string* error) {
  if (fields.size() < 4) {
    *error = "expected at least <id> <priority> <resource> <source>";
    return false;
  }
  task->id = fields[0];
  if (!core::ParsePriority(fields[1], &task->priority)) {
    *error = "invalid priority " + fields[1];
    return false;
  }
  if (!util::setUint64(&task->resource_estimate)(fields[2].c_str())) {
    *error = "invalid resource estimate " + fields[2];
    return false;
  }
  task->source_ref = fields[3];
  for (size_t i = 4; i < fields.size(); i++) {
    const std::string& field = fields[i];
    size_t eq = field.find('=');
    if (eq == std::string::npos) {
      task->depends_on.insert(field);
      continue;
    }
    std::string key = field.substr(0, eq);
    std::string value = field.substr(eq + 1);
    if (key == "dest") {
      task->destination = value;
    } else if (key == "size") {
      uint64_t size;
      if (!util::setUint64(&size)(value.c_str())) {
        *error = "invalid size " + value;
        return false;
      }
      task->total_size = static_cast<int64_t>(size);
    } else if (key == "sha256") {
      task->expected_checksum = value;
    } else {
      *error = "unknown key " + key;
      return false;
    }
  }
  return true;
}
}  // namespace

bool ParseManifest(const std::string& contents, std::vector<core::Task>* tasks,
                   std::string* error) {
  std::istringstream in(contents);
  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    line_number++;
    line = util::trim(line);
    if (line.empty() || line[0] == '#') continue;
    std::vector<std::string> fields;
    util::split(line, ' ', std::back_inserter(fields));
    core::Task task;
    std::string line_error;
    if (!ParseLine(fields, &task, &line_error)) {
      *error = "line " + std::to_string(line_number) + ": " + line_error;
      return false;
    }
    tasks->push_back(std::move(task));
  }
  return true;
}

bool LoadManifest(const std::string& path, std::vector<core::Task>* tasks,
                  std::string* error) {
  std::string contents;
  try {
    auto producer = util::File::Read(path);
    util::File::Chunk chunk;
    while ((chunk = producer()).size()) {
      contents.append(chunk.asChars().begin(), chunk.size());
    }
  } catch (std::system_error& exc) {
    *error = exc.what();
    return false;
  }
  return ParseManifest(contents, tasks, error);
}

}  // namespace cli
