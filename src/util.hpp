#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace callguard {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Milliseconds elapsed between two steady-clock points (never negative)
uint64_t elapsed_ms(TimePoint from, TimePoint to);

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter, dropping empty tokens after trimming
std::vector<std::string> split(const std::string& s, char delim);

// ASCII upper-case copy ("exa-v2" -> "EXA-V2")
std::string to_upper(const std::string& s);

// Redis-style glob match, anchored at both ends.
// '*' matches zero or more characters, '?' exactly one. Everything else is literal.
bool glob_match(const std::string& pattern, const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories as needed.
bool atomic_write_file(const std::string& path, const std::string& content);

// Uniform random double in [lo, hi)
double random_uniform(double lo, double hi);

} // namespace callguard
