#pragma once

#include <string>
#include <filesystem>

std::string calculate_sha256(const std::filesystem::path& file_path);

// Throws ChecksumException unless the file's SHA-256 equals `expected` (hex, any case)
void verify_sha256(const std::filesystem::path& file_path, const std::string& expected);
