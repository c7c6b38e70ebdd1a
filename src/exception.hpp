#pragma once

#include <stdexcept>
#include <string>

// Process exit statuses that are not passed through from a failing step
enum ExitStatus : int {
    EXIT_OK = 0,
    EXIT_TOOL_MISSING = 1,
    EXIT_EXTRACT_FAILED = 2,
    EXIT_USAGE = 64,
    EXIT_DATA_ERROR = 65,
    EXIT_CANT_CREATE = 73,
    EXIT_CONFIG = 78
};

class WmsetupException : public std::runtime_error {
public:
    explicit WmsetupException(const std::string& message, int exit_code = EXIT_CANT_CREATE)
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const noexcept { return exit_code_; }

private:
    int exit_code_;
};

// Thrown when the converter tool cannot be resolved on PATH
class ToolMissingException : public WmsetupException {
public:
    explicit ToolMissingException(const std::string& message)
        : WmsetupException(message, EXIT_TOOL_MISSING) {}
};

// Fetch failure; the exit code is the CURLcode of the failed transfer
class DownloadException : public WmsetupException {
public:
    DownloadException(const std::string& message, int curl_code)
        : WmsetupException(message, curl_code) {}
};

class ExtractException : public WmsetupException {
public:
    explicit ExtractException(const std::string& message)
        : WmsetupException(message, EXIT_EXTRACT_FAILED) {}
};

class ChecksumException : public WmsetupException {
public:
    explicit ChecksumException(const std::string& message)
        : WmsetupException(message, EXIT_DATA_ERROR) {}
};

class ConfigException : public WmsetupException {
public:
    explicit ConfigException(const std::string& message)
        : WmsetupException(message, EXIT_CONFIG) {}
};

// Bad command-line flag value
class UsageException : public WmsetupException {
public:
    explicit UsageException(const std::string& message)
        : WmsetupException(message, EXIT_USAGE) {}
};

// The converter ran and failed; the exit code is its status
class ConverterException : public WmsetupException {
public:
    ConverterException(const std::string& message, int status)
        : WmsetupException(message, status) {}
};
