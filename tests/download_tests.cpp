/*
Download and digest tests. Transfers use file:// URLs so no network is needed.
*/
#include "test_support.hpp"

#include "download.hpp"

#include <string>

using namespace TestSupport;
namespace Download = HhdInstall::Download;

namespace {

std::string fileUrl(const fs::path& path)
{
    return "file://" + path.string();
}

int test_sha256_known_vectors()
{
    TempDir tmp;
    fs::path abc = tmp.path() / "abc";
    fs::path empty = tmp.path() / "empty";
    writeFile(abc, "abc");
    writeFile(empty, "");

    EXPECT(Download::sha256File(abc.string()) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
           "sha256(abc)");
    EXPECT(Download::sha256File(empty.string()) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
           "sha256 of empty file");

    // Larger than one read buffer
    std::string big(20000, 'x');
    fs::path bigFile = tmp.path() / "big";
    writeFile(bigFile, big);
    EXPECT(Download::sha256File(bigFile.string()).size() == 64, "multi-block digest");
    return 0;
}

int test_digest_comparison()
{
    TempDir tmp;
    fs::path abc = tmp.path() / "abc";
    writeFile(abc, "abc");

    EXPECT(Download::digestMatches(abc.string(),
           "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"),
           "uppercase digest accepted");
    EXPECT(Download::digestMatches(abc.string(),
           "  ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad\n"),
           "surrounding whitespace ignored");
    EXPECT(!Download::digestMatches(abc.string(),
           "ca7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
           "different digest rejected");
    EXPECT(!Download::digestMatches(abc.string(), ""), "empty digest never matches");

    bool threw = false;
    try {
        Download::sha256File((tmp.path() / "missing").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT(threw, "hashing a missing file throws");
    return 0;
}

int test_download_writes_exact_bytes()
{
    TempDir tmp;
    fs::path source = tmp.path() / "src" / "83-hhd.rules";
    fs::path dest = tmp.path() / "out" / "nested" / "83-hhd.rules";
    std::string content = "line one\nline two\n";
    content.push_back('\0');
    content += "binary tail";
    writeFile(source, content);

    EXPECT(Download::toFile(fileUrl(source), dest.string()), "download succeeds");
    EXPECT(readFile(dest) == content, "bytes preserved");
    EXPECT(!fs::exists(dest.string() + ".part"), "no partial file left");

    // A second download replaces the file with fresh content
    writeFile(source, "updated\n");
    EXPECT(Download::toFile(fileUrl(source), dest.string()), "second download succeeds");
    EXPECT(readFile(dest) == "updated\n", "destination replaced");
    return 0;
}

int test_failed_download_keeps_destination()
{
    TempDir tmp;
    fs::path dest = tmp.path() / "83-hhd.rules";
    writeFile(dest, "previous\n");

    EXPECT(!Download::toFile(fileUrl(tmp.path() / "does-not-exist"), dest.string()),
           "missing source fails");
    EXPECT(readFile(dest) == "previous\n", "existing destination untouched");
    EXPECT(!fs::exists(dest.string() + ".part"), "partial file cleaned up");

    fs::path fresh = tmp.path() / "fresh.rules";
    EXPECT(!Download::toFile(fileUrl(tmp.path() / "does-not-exist"), fresh.string()),
           "missing source fails again");
    EXPECT(!fs::exists(fresh), "no destination created on failure");
    return 0;
}

} // namespace

int main(void)
{
    HhdInstall::CurlGlobal curl;

    if (test_sha256_known_vectors() != 0) return 1;
    if (test_digest_comparison() != 0) return 1;
    if (test_download_writes_exact_bytes() != 0) return 1;
    if (test_failed_download_keeps_destination() != 0) return 1;
    std::printf("download tests passed\n");
    return 0;
}
