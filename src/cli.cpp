#include "cli.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <utility>

namespace {

// Flag name -> config-file key, for the string-valued overrides
const std::pair<const char*, const char*> STRING_OVERRIDES[] = {
    {"work-dir", "work_dir"},
    {"output-dir", "output_dir"},
    {"url", "archive_url"},
    {"archive-name", "archive_name"},
    {"converter", "converter"},
    {"input-format", "input_format"},
    {"tags", "saved_model_tags"},
    {"output-nodes", "output_node_names"},
    {"source-pattern", "source_pattern"},
    {"sha256", "expected_sha256"},
};

} // anonymous namespace

cxxopts::Options make_cli_options(const std::string& program) {
    cxxopts::Options options(program);
    options.custom_help(get_string("info.usage"));
    options.set_width(100);

    options.add_options()
        ("h,help", get_string("help.help"))
        ("c,config", get_string("help.config"), cxxopts::value<std::string>())
        ("work-dir", get_string("help.work_dir"), cxxopts::value<std::string>())
        ("output-dir", get_string("help.output_dir"), cxxopts::value<std::string>())
        ("url", get_string("help.url"), cxxopts::value<std::string>())
        ("archive-name", get_string("help.archive_name"), cxxopts::value<std::string>())
        ("converter", get_string("help.converter"), cxxopts::value<std::string>())
        ("input-format", get_string("help.input_format"), cxxopts::value<std::string>())
        ("tags", get_string("help.tags"), cxxopts::value<std::string>())
        ("output-nodes", get_string("help.output_nodes"), cxxopts::value<std::string>())
        ("source-pattern", get_string("help.source_pattern"), cxxopts::value<std::string>())
        ("sha256", get_string("help.sha256"), cxxopts::value<std::string>())
        ("attempts", get_string("help.attempts"), cxxopts::value<int>())
        ("no-progress", get_string("help.no_progress"), cxxopts::value<bool>()->default_value("false"));
    return options;
}

InstallConfig build_config(const cxxopts::ParseResult& result) {
    InstallConfig config;
    if (result.count("config")) {
        load_config_file(result["config"].as<std::string>(), config);
    }
    for (const auto& [flag, key] : STRING_OVERRIDES) {
        if (result.count(flag)) {
            set_config_value(config, key, result[flag].as<std::string>());
        }
    }
    if (result.count("attempts")) {
        const int attempts = result["attempts"].as<int>();
        if (attempts < 1) {
            throw UsageException(string_format("error.invalid_flag_value", "--attempts", std::to_string(attempts)));
        }
        config.download_attempts = attempts;
    }
    if (result["no-progress"].as<bool>()) {
        config.show_progress = false;
    }
    return config;
}
