#include "utils.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <iostream>

namespace HhdInstall {

namespace {
    bool verboseEnabled = false;
}

void setVerbose(bool enabled)
{
    verboseEnabled = enabled;
}

bool isVerbose()
{
    return verboseEnabled;
}

/**
 * @brief libcurl callback function. Writes downloaded data into a std::ofstream.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize    = size * nmemb;
    std::ofstream* file = static_cast<std::ofstream*>(userp);

    file->write(static_cast<char*>(contents), static_cast<std::streamsize>(totalSize));
    if (!*file) {
        std::cerr << "Error writing downloaded data to disk" << std::endl;
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

void trim(std::string& s)
{
    const char *whitespace = " \t\n\r\f\v";
    s.erase(0, s.find_first_not_of(whitespace));
    s.erase(s.find_last_not_of(whitespace) + 1);
}

std::string expandHome(const std::string& path, const std::string& home)
{
    if (path == "~") {
        return home;
    }
    if (path.rfind("~/", 0) == 0) {
        std::string base = home;
        while (base.size() > 1 && base.back() == '/') {
            base.pop_back();
        }
        return base + path.substr(1);
    }
    return path;
}

std::string describeCommand(const std::vector<std::string>& args)
{
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line += ' ';
        }

        bool needsQuotes = arg.empty() ||
                           arg.find_first_of(" \t\n'\"$`\\") != std::string::npos;
        if (!needsQuotes) {
            line += arg;
            continue;
        }

        // Single-quote, escaping embedded single quotes
        line += '\'';
        for (char c : arg) {
            if (c == '\'') {
                line += "'\\''";
            } else {
                line += c;
            }
        }
        line += '\'';
    }
    return line;
}

namespace {

    // Absolute, normalized, and without a trailing separator
    std::filesystem::path normalizedDir(const std::filesystem::path& path)
    {
        std::filesystem::path p = std::filesystem::absolute(path).lexically_normal();
        if (!p.has_filename() && p != p.root_path()) {
            p = p.parent_path();
        }
        return p;
    }

} // namespace

bool isWithin(const std::filesystem::path& path, const std::filesystem::path& dir)
{
    const std::filesystem::path p = normalizedDir(path);
    const std::filesystem::path d = normalizedDir(dir);

    auto pIt = p.begin();
    for (auto dIt = d.begin(); dIt != d.end(); ++dIt, ++pIt) {
        if (pIt == p.end() || *pIt != *dIt) {
            return false;
        }
    }
    return true;
}

} // namespace HhdInstall
