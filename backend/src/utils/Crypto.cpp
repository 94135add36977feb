#include "utils/Crypto.hpp"

#include "utils/Log.hpp"

#include <array>
#include <fstream>
#include <memory>
#include <vector>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace kc::crypto
{

namespace
{

constexpr std::size_t kFileReadChunk = 64 * 1024;

struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX *ctx) const noexcept
    {
        EVP_MD_CTX_free(ctx);
    }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(unsigned char const *digest, unsigned int length)
{
    static constexpr char kHexDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
        out.push_back(kHexDigits[digest[i] >> 4]);
        out.push_back(kHexDigits[digest[i] & 0xF]);
    }
    return out;
}

} // namespace

std::string sha256_hex(std::span<std::uint8_t const> data)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length,
                   EVP_sha256(), nullptr) != 1)
    {
        return {};
    }
    return to_hex(digest.data(), length);
}

std::optional<std::string> sha256_file_hex(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(kFileReadChunk);
    while (input)
    {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = input.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(),
                             static_cast<std::size_t>(got)) != 1)
        {
            return std::nullopt;
        }
    }
    if (input.bad())
    {
        KC_LOG_WARN("crypto: read error while hashing {}", path.string());
        return std::nullopt;
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1)
    {
        return std::nullopt;
    }
    return to_hex(digest.data(), length);
}

std::optional<std::string> public_key_pin_from_pem(std::string_view pem)
{
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio)
    {
        return std::nullopt;
    }
    std::unique_ptr<X509, decltype(&X509_free)> cert(
        PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert)
    {
        return std::nullopt;
    }
    EVP_PKEY *key = X509_get0_pubkey(cert.get());
    if (key == nullptr)
    {
        return std::nullopt;
    }
    unsigned char *der = nullptr;
    int der_len = i2d_PUBKEY(key, &der);
    if (der_len <= 0 || der == nullptr)
    {
        return std::nullopt;
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    int ok = EVP_Digest(der, static_cast<std::size_t>(der_len), digest.data(),
                        &length, EVP_sha256(), nullptr);
    OPENSSL_free(der);
    if (ok != 1)
    {
        return std::nullopt;
    }
    // 4 * ceil(n / 3) characters plus the terminator.
    std::array<unsigned char, ((EVP_MAX_MD_SIZE + 2) / 3) * 4 + 1> encoded{};
    int encoded_len = EVP_EncodeBlock(encoded.data(), digest.data(),
                                      static_cast<int>(length));
    if (encoded_len <= 0)
    {
        return std::nullopt;
    }
    return std::string("sha256//") +
           std::string(reinterpret_cast<char const *>(encoded.data()),
                       static_cast<std::size_t>(encoded_len));
}

} // namespace kc::crypto
