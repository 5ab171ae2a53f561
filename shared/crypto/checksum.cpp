#include "checksum.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <openssl/evp.h>
#include <zlib.h>

namespace shared::crypto {

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);

    // zlib takes a uInt length; feed large buffers in slices.
    const std::uint8_t* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        const std::size_t chunk = std::min<std::size_t>(left, std::numeric_limits<uInt>::max());
        crc = ::crc32(crc, p, static_cast<uInt>(chunk));
        p += chunk;
        left -= chunk;
    }

    return static_cast<std::uint32_t>(crc);
}

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("Md5: failed to initialise OpenSSL digest");
    }
}

Md5::~Md5() {
    EVP_MD_CTX_free(ctx_);
}

void Md5::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        throw std::logic_error("Md5: update after finalize");
    }
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error("Md5: digest update failed");
    }
}

Md5Digest Md5::finalize() {
    if (finalized_) {
        throw std::logic_error("Md5: finalize called twice");
    }

    Md5Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != MD5_DIGEST_SIZE) {
        throw std::runtime_error("Md5: digest finalize failed");
    }
    finalized_ = true;
    return out;
}

Md5Digest md5(std::span<const std::uint8_t> data) {
    Md5 h;
    h.update(data);
    return h.finalize();
}

} // namespace shared::crypto
