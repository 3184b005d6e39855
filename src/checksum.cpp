#include "checksum.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>

#include <fmt/core.h>

#include <openssl/evp.h>

namespace
{
    using Algorithm = ChecksumVerifier::Algorithm;

    struct AlgorithmInfo
    {
        const char *name;
        Algorithm algorithm;
        size_t hexLength;
    };

    constexpr AlgorithmInfo ALGORITHMS[] = {
        {"sha256", Algorithm::SHA256, 64},
        {"sha1", Algorithm::SHA1, 40},
    };

    /**
     * One running EVP digest. Throws std::runtime_error on any OpenSSL failure.
     */
    class Digest
    {
    public:
        explicit Digest(Algorithm algorithm)
            : context_(EVP_MD_CTX_new(), EVP_MD_CTX_free)
        {
            if (!context_)
            {
                throw std::runtime_error("Failed to create OpenSSL digest context");
            }
            const EVP_MD *md = algorithm == Algorithm::SHA1 ? EVP_sha1() : EVP_sha256();
            if (EVP_DigestInit_ex(context_.get(), md, nullptr) != 1)
            {
                throw std::runtime_error("Failed to initialize digest");
            }
        }

        void update(const char *data, size_t length)
        {
            if (EVP_DigestUpdate(context_.get(), data, length) != 1)
            {
                throw std::runtime_error("Failed to update digest");
            }
        }

        std::string hex()
        {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int length = 0;
            if (EVP_DigestFinal_ex(context_.get(), hash, &length) != 1)
            {
                throw std::runtime_error("Failed to finalize digest");
            }

            std::string result;
            result.reserve(length * 2);
            for (unsigned int i = 0; i < length; ++i)
            {
                result += fmt::format("{:02x}", hash[i]);
            }
            return result;
        }

    private:
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
    };
}

std::string ChecksumVerifier::computeDigest(const std::filesystem::path &filePath, Algorithm algorithm)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    Digest digest(algorithm);
    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        digest.update(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    return digest.hex();
}

std::string ChecksumVerifier::computeDigest(const std::vector<char> &data, Algorithm algorithm)
{
    Digest digest(algorithm);
    digest.update(data.data(), data.size());
    return digest.hex();
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath, const std::string &expectedChecksum)
{
    auto [algorithm, expectedHash] = parseChecksum(expectedChecksum);
    return computeDigest(filePath, algorithm) == expectedHash;
}

std::pair<ChecksumVerifier::Algorithm, std::string> ChecksumVerifier::parseChecksum(const std::string &checksum)
{
    auto colon = checksum.find(':');
    if (colon == std::string::npos)
    {
        throw std::runtime_error("Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string name = checksum.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });

    auto info = std::find_if(std::begin(ALGORITHMS), std::end(ALGORITHMS),
                             [&name](const AlgorithmInfo &candidate)
                             { return name == candidate.name; });
    if (info == std::end(ALGORITHMS))
    {
        throw std::runtime_error(fmt::format("Unsupported algorithm: '{}' (use sha256 or sha1)", name));
    }

    std::string hash = normalizeHex(checksum.substr(colon + 1));
    if (hash.length() != info->hexLength)
    {
        throw std::runtime_error(fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                                             info->name, info->hexLength, hash.length()));
    }
    return {info->algorithm, hash};
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || ch == ':' || ch == '-')
        {
            continue;
        }
        if (!std::isxdigit(c))
        {
            throw std::runtime_error(fmt::format("Invalid character in checksum: '{}'", ch));
        }
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}
