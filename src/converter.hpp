#pragma once

#include "config.hpp"

#include <string>
#include <vector>
#include <filesystem>

// Matches `pattern` (fnmatch wildcards per path component) against
// directories under `base`. Returns the match relative to `base`; when
// several match, the lexicographically greatest wins. Throws ExtractException
// when nothing matches.
std::filesystem::path resolve_model_source(const std::filesystem::path& base, const std::string& pattern);

// argv for the converter, argv[0] included:
// <tool> --input_format= --saved_model_tags= --output_node_names= <source> <output>
std::vector<std::string> build_converter_args(const std::string& tool, const InstallConfig& config,
                                              const std::filesystem::path& model_source,
                                              const std::filesystem::path& output_path);

// Runs argv[0] with `cwd` as working directory and waits for it.
// Returns the exit status, 128 + signal when killed, 127 when exec fails.
int run_process(const std::vector<std::string>& args, const std::filesystem::path& cwd);

// Resolves the model source inside work_dir and runs the converter so that it
// writes config.output_dir. Throws ConverterException on a non-zero status.
void run_converter(const std::filesystem::path& tool_path, const InstallConfig& config);
