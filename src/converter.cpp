#include "converter.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fnmatch.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace fs = std::filesystem;

namespace {

bool has_wildcard(const std::string& component) {
    return component.find_first_of("*?[") != std::string::npos;
}

// Expands one pattern component against every candidate collected so far
std::vector<fs::path> expand_component(const std::vector<fs::path>& candidates, const std::string& component) {
    std::vector<fs::path> next;
    for (const auto& dir : candidates) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        if (!has_wildcard(component)) {
            if (fs::exists(dir / component, ec)) {
                next.push_back(dir / component);
            }
            continue;
        }

        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            const std::string name = entry.path().filename().string();
            if (fnmatch(component.c_str(), name.c_str(), FNM_PERIOD) == 0) {
                next.push_back(entry.path());
            }
        }
    }
    return next;
}

} // anonymous namespace

fs::path resolve_model_source(const fs::path& base, const std::string& pattern) {
    const fs::path pattern_path(pattern);
    if (pattern_path.is_absolute()) {
        throw ConfigException(string_format("error.pattern_absolute", pattern));
    }

    std::vector<fs::path> candidates = {base};
    for (const auto& component : pattern_path.lexically_normal()) {
        const std::string part = component.string();
        if (part.empty() || part == ".") continue;
        candidates = expand_component(candidates, part);
        if (candidates.empty()) break;
    }

    std::vector<fs::path> matches;
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            matches.push_back(candidate.lexically_relative(base));
        }
    }

    if (matches.empty()) {
        throw ExtractException(string_format("error.model_source_not_found", pattern, base.string()));
    }

    std::sort(matches.begin(), matches.end());
    if (matches.size() > 1) {
        log_warning(string_format("warning.multiple_model_sources", pattern, matches.size(), matches.back().string()));
    }
    return matches.back();
}

std::vector<std::string> build_converter_args(const std::string& tool, const InstallConfig& config,
                                              const fs::path& model_source, const fs::path& output_path) {
    return {
        tool,
        "--input_format=" + config.input_format,
        "--saved_model_tags=" + config.saved_model_tags,
        "--output_node_names=" + config.output_node_names,
        model_source.string(),
        output_path.string()
    };
}

int run_process(const std::vector<std::string>& args, const fs::path& cwd) {
    if (args.empty()) {
        throw WmsetupException(get_string("error.empty_command"), EXIT_USAGE);
    }

    std::vector<char*> c_args;
    for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    // Buffered output would otherwise be written twice once the child exits
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if (pid == -1) {
        throw WmsetupException(string_format("error.fork_failed", std::string(std::strerror(errno))), EXIT_CANT_CREATE);
    }
    if (pid == 0) {
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(127);
        execv(c_args[0], c_args.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw WmsetupException(string_format("error.wait_failed", std::string(std::strerror(errno))), EXIT_CANT_CREATE);
        }
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 127;
}

void run_converter(const fs::path& tool_path, const InstallConfig& config) {
    const fs::path model_source = resolve_model_source(config.work_dir, config.source_pattern);
    // The converter runs inside work_dir, so the output path is rebased onto it
    const fs::path output_rel = fs::absolute(config.output_dir).lexically_normal()
        .lexically_proximate(fs::absolute(config.work_dir).lexically_normal());

    const auto args = build_converter_args(fs::absolute(tool_path).string(), config, model_source, output_rel);
    log_info(string_format("info.running_converter", config.converter, model_source.string(), config.output_dir.string()));

    const int status = run_process(args, config.work_dir);
    if (status != 0) {
        throw ConverterException(string_format("error.converter_failed", config.converter, status), status);
    }
}
