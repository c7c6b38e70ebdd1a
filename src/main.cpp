#include "cli.hpp"
#include "exception.hpp"
#include "installer.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <iostream>
#include <string>

// libcurl's global state lives exactly as long as main
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        auto options = make_cli_options(argv[0]);
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return EXIT_OK;
        }

        if (!result.unmatched().empty()) {
            log_error(string_format("error.unexpected_argument", result.unmatched().front()));
            std::cerr << options.help() << std::endl;
            return EXIT_USAGE;
        }

        return run_install(build_config(result));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return EXIT_USAGE;
    } catch (const WmsetupException& e) {
        log_error(e.what());
        return e.exit_code();
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return EXIT_CANT_CREATE;
    }
}
