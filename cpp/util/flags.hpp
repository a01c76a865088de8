#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static std::string state_directory;
  static std::string download_directory;

  // Run-only flags
  static std::string manifest;
  static std::string source_directory;
  static int32_t max_concurrent;
  static uint64_t resource_ceiling;
  static double rate;
  static double burst;
  static double min_rate;
  static double max_rate;
  static uint32_t chunk_size_kb;
  static int32_t max_attempts;
  static bool allow_priority_updates;
  static bool skip_resume_verification;
};

#endif
