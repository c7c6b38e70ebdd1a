#pragma once

#include <string>
#include <filesystem>

// Fetches `url` into `output_path` with HTTP GET. Throws DownloadException
// carrying the CURLcode on failure, including HTTP error statuses.
void download_file(const std::string& url, const std::filesystem::path& output_path, bool show_progress = true);
void download_with_retries(const std::string& url, const std::filesystem::path& output_path, int max_attempts = 1, bool show_progress = true);
