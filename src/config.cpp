#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "yes" || v == "1") return true;
    if (v == "false" || v == "no" || v == "0") return false;
    throw ConfigException(string_format("error.config_invalid_value", key, value));
}

int parse_positive_int(const std::string& key, const std::string& value) {
    int result = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, result);
    if (ec != std::errc() || ptr != end || result < 1) {
        throw ConfigException(string_format("error.config_invalid_value", key, value));
    }
    return result;
}

} // anonymous namespace

std::string archive_name_from_url(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        // Drop the authority so a bare host does not become the file name
        const auto path_start = path.find('/', scheme + 3);
        path = (path_start == std::string::npos) ? "" : path.substr(path_start);
    }
    const auto slash = path.find_last_of('/');
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

std::string effective_archive_name(const InstallConfig& config) {
    if (!config.archive_name.empty()) {
        return config.archive_name;
    }
    return archive_name_from_url(config.archive_url);
}

void set_config_value(InstallConfig& config, const std::string& key, const std::string& value) {
    if (key == "work_dir") {
        config.work_dir = value;
    } else if (key == "output_dir") {
        config.output_dir = value;
    } else if (key == "archive_url") {
        config.archive_url = value;
    } else if (key == "archive_name") {
        config.archive_name = value;
    } else if (key == "converter") {
        config.converter = value;
    } else if (key == "input_format") {
        config.input_format = value;
    } else if (key == "saved_model_tags") {
        config.saved_model_tags = value;
    } else if (key == "output_node_names") {
        config.output_node_names = value;
    } else if (key == "source_pattern") {
        config.source_pattern = value;
    } else if (key == "expected_sha256") {
        config.expected_sha256 = value;
    } else if (key == "download_attempts") {
        config.download_attempts = parse_positive_int(key, value);
    } else if (key == "show_progress") {
        config.show_progress = parse_bool(key, value);
    } else {
        throw ConfigException(string_format("error.config_unknown_key", key));
    }
}

void load_config_file(const fs::path& path, InstallConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException(string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        const std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        const auto eq = stripped.find('=');
        if (eq == std::string::npos) {
            throw ConfigException(string_format("error.config_syntax", path.string(), line_no));
        }
        set_config_value(config, trim(stripped.substr(0, eq)), trim(stripped.substr(eq + 1)));
    }
}

void validate_config(const InstallConfig& config) {
    if (config.work_dir.empty()) {
        throw ConfigException(string_format("error.config_missing_value", "work_dir"));
    }
    if (config.output_dir.empty()) {
        throw ConfigException(string_format("error.config_missing_value", "output_dir"));
    }
    if (config.archive_url.empty()) {
        throw ConfigException(string_format("error.config_missing_value", "archive_url"));
    }
    if (config.converter.empty()) {
        throw ConfigException(string_format("error.config_missing_value", "converter"));
    }
    if (config.source_pattern.empty()) {
        throw ConfigException(string_format("error.config_missing_value", "source_pattern"));
    }
    const std::string name = effective_archive_name(config);
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        throw ConfigException(string_format("error.config_bad_archive_name", config.archive_url));
    }
    if (config.download_attempts < 1) {
        throw ConfigException(string_format("error.config_invalid_value", "download_attempts", std::to_string(config.download_attempts)));
    }
}
