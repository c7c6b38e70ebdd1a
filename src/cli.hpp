#pragma once

#include "config.hpp"

#include <cxxopts.hpp>

#include <string>

// Every flag wmsetup accepts; help texts come from the l10n files
cxxopts::Options make_cli_options(const std::string& program);

// Layers the parsed command line over the defaults: a --config file first,
// then individual flags. Bad flag values throw UsageException, bad file
// contents ConfigException.
InstallConfig build_config(const cxxopts::ParseResult& result);
