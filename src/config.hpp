#pragma once

#include <string>
#include <filesystem>

// Defaults used when neither a config file nor a flag sets a field
inline constexpr const char* DEFAULT_WORK_DIR = "model_work";
inline constexpr const char* DEFAULT_OUTPUT_DIR = "web_model";
inline constexpr const char* DEFAULT_ARCHIVE_URL = "https://example.com/models/mnist_saved_model.tar.gz";
inline constexpr const char* DEFAULT_CONVERTER = "tensorflowjs_converter";
inline constexpr const char* DEFAULT_INPUT_FORMAT = "tf_saved_model";
inline constexpr const char* DEFAULT_SAVED_MODEL_TAGS = "serve";
inline constexpr const char* DEFAULT_OUTPUT_NODE_NAMES = "classes,probabilities";
inline constexpr const char* DEFAULT_SOURCE_PATTERN = "export/*";

struct InstallConfig {
    // Staging directory for the archive and its extracted contents
    std::filesystem::path work_dir = DEFAULT_WORK_DIR;
    // Converter destination; its existence means "already installed"
    std::filesystem::path output_dir = DEFAULT_OUTPUT_DIR;
    std::string archive_url = DEFAULT_ARCHIVE_URL;
    // File name inside work_dir; derived from archive_url when empty
    std::string archive_name;

    std::string converter = DEFAULT_CONVERTER;
    std::string input_format = DEFAULT_INPUT_FORMAT;
    std::string saved_model_tags = DEFAULT_SAVED_MODEL_TAGS;
    std::string output_node_names = DEFAULT_OUTPUT_NODE_NAMES;
    // Glob, relative to work_dir, selecting the extracted model directory
    std::string source_pattern = DEFAULT_SOURCE_PATTERN;

    // Lowercase or uppercase hex digest; empty skips verification
    std::string expected_sha256;
    int download_attempts = 1;
    bool show_progress = true;
};

// Last path segment of a URL, ignoring any query string or fragment
std::string archive_name_from_url(const std::string& url);

// archive_name if set, otherwise derived from archive_url
std::string effective_archive_name(const InstallConfig& config);

// Applies `key = value` lines from a config file on top of `config`
void load_config_file(const std::filesystem::path& path, InstallConfig& config);

// Sets one field by its config-file key; throws ConfigException on unknown keys or bad values
void set_config_value(InstallConfig& config, const std::string& key, const std::string& value);

// Checks fields the installer cannot work without
void validate_config(const InstallConfig& config);
