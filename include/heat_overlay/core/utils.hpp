#pragma once

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace heat_overlay::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
// Throws InputTooLargeError when the file is larger than max_bytes.
std::vector<uint8_t> read_bytes_limited(const fs::path& path, std::uintmax_t max_bytes,
                                        const std::string& what);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
// Keeps empty fields: split("a||b|", '|') yields {"a", "", "b", ""}.
std::vector<std::string> split(const std::string& str, char delimiter);
// Whole-token decimal parse in the C locale, surrounding whitespace allowed.
// Accepts underscores between digits and inf/infinity/nan; rejects hex.
std::optional<double> parse_double(const std::string& s);

} // namespace heat_overlay::core
