#include "installer.hpp"

#include "archive.hpp"
#include "converter.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <utility>

namespace fs = std::filesystem;

InstallSteps InstallSteps::defaults() {
    InstallSteps steps;
    steps.locate_tool = [](const std::string& name) { return find_executable(name); };
    steps.fetch = [](const std::string& url, const fs::path& out, int attempts, bool progress) {
        download_with_retries(url, out, attempts, progress);
    };
    steps.verify = [](const fs::path& file, const std::string& expected) { verify_sha256(file, expected); };
    steps.extract = [](const fs::path& archive, const fs::path& dir) { extract_archive(archive, dir); };
    steps.convert = [](const fs::path& tool, const InstallConfig& config) { run_converter(tool, config); };
    return steps;
}

Installer::Installer(InstallConfig config, InstallSteps steps)
    : config_(std::move(config)), steps_(std::move(steps)) {}

fs::path Installer::archive_path() const {
    return config_.work_dir / effective_archive_name(config_);
}

bool Installer::output_exists() const {
    std::error_code ec;
    return fs::is_directory(config_.output_dir, ec);
}

fs::path Installer::require_tool() const {
    auto tool = steps_.locate_tool(config_.converter);
    if (!tool) {
        throw ToolMissingException(string_format("error.tool_not_found", config_.converter));
    }
    return *tool;
}

void Installer::acquire() {
    ensure_dir_exists(config_.work_dir);

    const fs::path archive = archive_path();
    log_info(string_format("info.downloading_from", config_.archive_url, archive.string()));
    steps_.fetch(config_.archive_url, archive, config_.download_attempts, config_.show_progress);

    if (!config_.expected_sha256.empty()) {
        log_info(get_string("info.verifying_checksum"));
        steps_.verify(archive, config_.expected_sha256);
    }

    steps_.extract(archive, config_.work_dir);
}

InstallOutcome Installer::run() {
    validate_config(config_);

    if (output_exists()) {
        log_info(string_format("info.already_installed", config_.output_dir.string()));
        return InstallOutcome::ALREADY_INSTALLED;
    }

    const fs::path tool = require_tool();
    log_info(string_format("info.tool_found", config_.converter, tool.string()));

    acquire();
    steps_.convert(tool, config_);

    log_info(string_format("info.install_complete", config_.output_dir.string()));
    return InstallOutcome::INSTALLED;
}

int run_install(const InstallConfig& config, InstallSteps steps) {
    try {
        Installer(config, std::move(steps)).run();
        return EXIT_OK;
    } catch (const WmsetupException& e) {
        log_error(e.what());
        return e.exit_code();
    } catch (const fs::filesystem_error& e) {
        log_error(string_format("error.filesystem", e.what()));
        return EXIT_CANT_CREATE;
    }
}
