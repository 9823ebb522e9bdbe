#include "cardpack/digest.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cstdint>

namespace cardpack {

std::string
hex_encode(std::span<const std::byte> bytes)
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        const uint8_t b = static_cast<uint8_t>(bytes[i]);
        out[2 * i + 0]  = kHex[(b >> 4) & 0xF];
        out[2 * i + 1]  = kHex[b & 0xF];
    }
    return out;
}


std::vector<std::byte>
sha256(std::span<const std::byte> bytes)
{
    std::vector<std::byte> md(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
           reinterpret_cast<unsigned char*>(md.data()));
    return md;
}


std::string
sha256_hex(std::span<const std::byte> bytes)
{
    return hex_encode(sha256(bytes));
}


std::string
sha256_hex(std::string_view text)
{
    return sha256_hex(as_bytes(text));
}


std::vector<std::byte>
hmac_sha256(std::span<const std::byte> key, std::string_view message)
{
    std::vector<std::byte> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(message.data()),
         message.size(), reinterpret_cast<unsigned char*>(result.data()),
         &len);
    result.resize(len);
    return result;
}


std::vector<std::byte>
hmac_sha256(std::string_view key, std::string_view message)
{
    return hmac_sha256(as_bytes(key), message);
}


bool
constant_time_equal(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}


std::string
random_hex_id(size_t nbytes)
{
    std::vector<std::byte> buf(nbytes);
    if (RAND_bytes(reinterpret_cast<unsigned char*>(buf.data()),
                   static_cast<int>(buf.size()))
        != 1) {
        return {};
    }
    return hex_encode(buf);
}

}  // namespace cardpack
