#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {

// CURLOPT_WRITEFUNCTION sink; a short count makes curl abort with CURLE_WRITE_ERROR
size_t write_to_stream(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    const size_t bytes = size * nmemb;
    if (!out->write(data, static_cast<std::streamsize>(bytes))) {
        return 0;
    }
    return bytes;
}

// Servers that omit Content-Length report dltotal 0; no bar is drawn for those
int report_progress(void*, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    if (dltotal > 0) {
        log_progress(get_string("info.downloading"), 100.0 * static_cast<double>(dlnow) / static_cast<double>(dltotal));
    }
    return 0;
}

struct EasyHandleCleanup {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using CurlHandle = std::unique_ptr<CURL, EasyHandleCleanup>;

} // anonymous namespace

void download_file(const std::string& url, const fs::path& output_path, bool show_progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw DownloadException(string_format("error.download_failed", url), CURLE_FAILED_INIT);
    }

    std::ofstream ofile(output_path, std::ios::binary | std::ios::trunc);
    if (!ofile) {
        throw WmsetupException(string_format("error.create_file_failed", output_path.string()), EXIT_CANT_CREATE);
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    if (show_progress) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, report_progress);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    end_progress();
    ofile.close();

    if (res != CURLE_OK) {
        std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        throw DownloadException(string_format("error.download_failed", url) + ": " + detail, static_cast<int>(res));
    }
    if (!ofile) {
        throw WmsetupException(string_format("error.write_file_failed", output_path.string()), EXIT_CANT_CREATE);
    }
}

void download_with_retries(const std::string& url, const fs::path& output_path, int max_attempts, bool show_progress) {
    for (int i = 0; i < max_attempts; ++i) {
        try {
            download_file(url, output_path, show_progress);
            return;
        } catch (const DownloadException& e) {
            if (i < max_attempts - 1) {
                std::error_code ec;
                fs::remove(output_path, ec);
                log_warning(string_format("warning.download_retry", e.what(), i + 2, max_attempts));
            } else {
                throw;
            }
        }
    }
}
