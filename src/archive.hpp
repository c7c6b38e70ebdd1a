#pragma once

#include <string>
#include <filesystem>

// Extracts any libarchive-readable archive (tar.gz, tar.zst, ...) into
// output_dir, replacing same-named files. Throws ExtractException.
void extract_archive(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir);
