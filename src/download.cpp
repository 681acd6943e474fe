#include "download.hpp"
#include "utils.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <curl/curl.h>   // For downloading files (libcurl)
#include <openssl/evp.h> // SHA-256 digests

namespace fs = std::filesystem;

namespace HhdInstall {

CurlGlobal::CurlGlobal()
{
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl: " +
                                 std::string(curl_easy_strerror(res)));
    }
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

namespace Download {

bool toFile(const std::string& url, const std::string& outputPath)
{
    log_message("Downloading: " + url + " -> " + outputPath);

    fs::path outPathFs(outputPath);
    fs::path parentDir = outPathFs.parent_path();
    if (!parentDir.empty() && !fs::exists(parentDir)) {
        try {
            fs::create_directories(parentDir);
        } catch (const std::exception& e) {
            log_error("Error creating directory " + parentDir.string() + ": " + e.what());
            return false;
        }
    }

    const std::string partPath = outputPath + ".part";

    CURL* curl = curl_easy_init();
    if (!curl) {
        log_error("Failed to initialize curl.");
        return false;
    }

    std::ofstream outFile(partPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        log_error("Failed to open file for writing: " + partPath);
        curl_easy_cleanup(curl);
        return false;
    }

    // Configure cURL
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &outFile);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "hhd-install/1.0");

    CURLcode res = curl_easy_perform(curl);
    long response_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    }

    curl_easy_cleanup(curl);
    outFile.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        log_error("Error downloading " + url + ": " + curl_easy_strerror(res));
        fs::remove(partPath, ec);
        return false;
    }

    // file:// transfers report 0
    if (response_code >= 400) {
        log_error("Error downloading " + url + ": Server responded with code " +
                  std::to_string(response_code));
        fs::remove(partPath, ec);
        return false;
    }

    if (!outFile) {
        log_error("Error writing " + partPath);
        fs::remove(partPath, ec);
        return false;
    }

    fs::rename(partPath, outputPath, ec);
    if (ec) {
        log_error("Error moving " + partPath + " to " + outputPath + ": " + ec.message());
        fs::remove(partPath, ec);
        return false;
    }

    return true;
}

std::string sha256File(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open " + path + " for hashing");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("EVP_DigestUpdate failed for " + path);
        }
    }
    if (file.bad()) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Error reading " + path + " for hashing");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestFinal_ex failed for " + path);
    }
    EVP_MD_CTX_free(ctx);

    // Convert to hex string
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

bool digestMatches(const std::string& path, const std::string& expectedHex)
{
    std::string expected = expectedHex;
    trim(expected);
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return !expected.empty() && sha256File(path) == expected;
}

} // namespace Download
} // namespace HhdInstall
