#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Converts "10MB", "1.5GiB", "300K" or "500" (plain bytes) into a byte count.
// K/M/G/T and their B / iB spellings are all powers of 1024.
std::optional<uint64_t> parse_size(const std::string& str);
