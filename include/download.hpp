#ifndef DOWNLOAD_HPP
#define DOWNLOAD_HPP

#include <string>

namespace HhdInstall {

/**
 * @class CurlGlobal
 * @brief Scoped libcurl global initialization. Construct once in main()
 *        before any transfer.
 */
class CurlGlobal
{
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

namespace Download {

/**
 * @brief Downloads a URL to a file using a synchronous cURL transfer.
 *
 * The body is written to "<outputPath>.part" and renamed into place only
 * after a complete, successful transfer, so outputPath never holds a
 * truncated download. Any existing outputPath is replaced.
 *
 * @param url        Source URL (https://, or file:// for local sources).
 * @param outputPath Destination file; parent directories are created.
 * @return True on success; false after logging the error.
 */
bool toFile(const std::string& url, const std::string& outputPath);

/**
 * @brief Computes the SHA-256 digest of a file.
 *
 * @return Lowercase hex digest.
 * @throws std::runtime_error if the file cannot be read or hashed.
 */
std::string sha256File(const std::string& path);

/**
 * @brief Compares a file's SHA-256 digest to an expected hex string
 *        (case-insensitive).
 */
bool digestMatches(const std::string& path, const std::string& expectedHex);

} // namespace Download
} // namespace HhdInstall

#endif // DOWNLOAD_HPP
