#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;
std::string Flags::state_directory = "state";
std::string Flags::download_directory = "downloads";

std::string Flags::manifest;
std::string Flags::source_directory;
int32_t Flags::max_concurrent = 3;
uint64_t Flags::resource_ceiling = 0;
double Flags::rate = 10.0;
double Flags::burst = 10.0;
double Flags::min_rate = 0.5;
double Flags::max_rate = 20.0;
uint32_t Flags::chunk_size_kb = 2048;
int32_t Flags::max_attempts = 5;
bool Flags::allow_priority_updates = false;
bool Flags::skip_resume_verification = false;
