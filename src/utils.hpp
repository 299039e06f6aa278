#pragma once
#include <cstddef>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> random_bytes(std::size_t count);

// Random 128-bit identifier rendered as a version 4 UUID string.
std::string make_share_id();

std::string to_lower_copy(std::string value);
std::string trim_copy(std::string value);
bool less_case_insensitive(const std::string& a, const std::string& b);
