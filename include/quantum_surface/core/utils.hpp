#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace quantum_surface::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string format_iso_utc(TimePoint tp);
std::string format_iso_local(TimePoint tp);
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
std::vector<fs::path> list_files(const fs::path& dir, const std::string& prefix,
                                 const std::string& ext);

// Hash utilities
std::string sha256_file(const fs::path& path);

// Math utilities
double fract(double x);           // x - floor(x), always in [0, 1)
double wrap_two_pi(double angle); // into [0, 2pi)
double wrapped_phi_distance(double phi_a, double phi_b);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

} // namespace quantum_surface::core
