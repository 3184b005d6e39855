#include "checksum.hpp"
#include "test_support.hpp"

#include <fstream>
#include <stdexcept>

namespace
{
    // Well-known digests of "abc"
    const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    const std::string ABC_SHA1 = "a9993e364706816aba3e25717850c26c9cd0d89d";

    bool throwsRuntimeError(const std::string &checksum)
    {
        try
        {
            ChecksumVerifier::parseChecksum(checksum);
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }
}

int main()
{
    TempDirectory temp("torrent_streamer_checksum");
    auto descriptor = temp.path() / "abc.torrent";
    {
        std::ofstream out(descriptor, std::ios::binary);
        out << "abc";
    }

    try
    {
        section("Digests");
        check(ChecksumVerifier::computeDigest(descriptor, ChecksumVerifier::Algorithm::SHA256) == ABC_SHA256,
              "SHA-256 of a file");
        check(ChecksumVerifier::computeDigest(descriptor, ChecksumVerifier::Algorithm::SHA1) == ABC_SHA1,
              "SHA-1 of a file");
        check(ChecksumVerifier::computeDigest(std::vector<char>{'a', 'b', 'c'}, ChecksumVerifier::Algorithm::SHA256) == ABC_SHA256,
              "SHA-256 of a buffer matches the file digest");

        section("Verification");
        check(ChecksumVerifier::verify(descriptor, "sha256:" + ABC_SHA256), "correct sha256 checksum accepted");
        check(ChecksumVerifier::verify(descriptor, "SHA1:" + ABC_SHA1), "algorithm name is case-insensitive");
        check(ChecksumVerifier::verify(descriptor, "sha1:A9993E36-4706816A-BA3E2571-7850C26C-9CD0D89D"),
              "uppercase hex with separators accepted");
        check(!ChecksumVerifier::verify(descriptor, "sha256:" + std::string(64, '0')), "wrong checksum rejected");

        bool missingThrows = false;
        try
        {
            ChecksumVerifier::verify(temp.path() / "missing.torrent", "sha256:" + ABC_SHA256);
        }
        catch (const std::runtime_error &)
        {
            missingThrows = true;
        }
        check(missingThrows, "unreadable file throws");

        section("Parsing");
        auto [algo, hexHash] = ChecksumVerifier::parseChecksum("sha256:" + ABC_SHA256);
        check(algo == ChecksumVerifier::Algorithm::SHA256, "sha256 algorithm parsed");
        check(hexHash == ABC_SHA256, "hash parsed");

        check(throwsRuntimeError(ABC_SHA256), "missing algorithm prefix rejected");
        check(throwsRuntimeError("md5:900150983cd24fb0d6963f7d28e17f72"), "md5 is not supported");
        check(throwsRuntimeError("sha1:" + ABC_SHA256), "sha1 with a 64 character hash rejected");
        check(throwsRuntimeError("sha256:xyz"), "non-hex characters rejected");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return finish();
}
