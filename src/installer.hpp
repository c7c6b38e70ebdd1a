#pragma once

#include "config.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

// The external actions the installer performs. Defaults are the real
// implementations; tests swap in recording stubs.
struct InstallSteps {
    std::function<std::optional<std::filesystem::path>(const std::string&)> locate_tool;
    std::function<void(const std::string&, const std::filesystem::path&, int, bool)> fetch;
    std::function<void(const std::filesystem::path&, const std::string&)> verify;
    std::function<void(const std::filesystem::path&, const std::filesystem::path&)> extract;
    std::function<void(const std::filesystem::path&, const InstallConfig&)> convert;

    static InstallSteps defaults();
};

enum class InstallOutcome {
    ALREADY_INSTALLED,
    INSTALLED
};

class Installer {
public:
    explicit Installer(InstallConfig config, InstallSteps steps = InstallSteps::defaults());

    // Guards first, then fetch, extract and convert. Throws WmsetupException
    // (or a subclass) carrying the process status of the failed step.
    InstallOutcome run();

    const InstallConfig& config() const { return config_; }
    std::filesystem::path archive_path() const;

private:
    bool output_exists() const;
    std::filesystem::path require_tool() const;
    void acquire();

    InstallConfig config_;
    InstallSteps steps_;
};

// Runs the installer and maps the outcome to a process exit status, logging failures
int run_install(const InstallConfig& config, InstallSteps steps = InstallSteps::defaults());
