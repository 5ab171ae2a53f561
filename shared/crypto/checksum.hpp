#pragma once

#include <array>
#include <cstdint>
#include <span>

// EVP_MD_CTX is an opaque OpenSSL type.
struct evp_md_ctx_st;

namespace shared::crypto {

constexpr std::size_t MD5_DIGEST_SIZE = 16;

using Md5Digest = std::array<std::uint8_t, MD5_DIGEST_SIZE>;

// Standard CRC-32 (IEEE 802.3, as produced by zlib).
std::uint32_t crc32(std::span<const std::uint8_t> data);

// Incremental MD5 digest.
class Md5 {
public:
    Md5();
    ~Md5();

    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void update(std::span<const std::uint8_t> data);

    // Returns the digest. The object must not be updated afterwards.
    Md5Digest finalize();

private:
    evp_md_ctx_st* ctx_{nullptr};
    bool finalized_{false};
};

Md5Digest md5(std::span<const std::uint8_t> data);

} // namespace shared::crypto
