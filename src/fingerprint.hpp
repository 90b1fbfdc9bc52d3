#pragma once
#include <string>

// Hex SHA-256 of data.
std::string sha256_hex(const std::string& data);

// First `len` hex chars of the SHA-256 of the concatenated parts.
std::string short_fingerprint(const std::string& a, const std::string& b, size_t len = 12);
