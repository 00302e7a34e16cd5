#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string format_bytes(uint64_t bytes);
std::string format_rate(double bytes_per_sec);
std::string guess_mime_type(const std::filesystem::path& path);
std::string to_lower_copy(std::string value);
