#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <stdexcept>

namespace pledge {

namespace {

EVP_MD_CTX* as_ctx(void* ctx) {
    return static_cast<EVP_MD_CTX*>(ctx);
}

[[noreturn]] void digest_failure(const char* what) {
    log::crypto.error(what);
    throw std::runtime_error(what);
}

}  // namespace

// ============================================================================
// SHA3Hasher Implementation
// ============================================================================

SHA3Hasher::SHA3Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        digest_failure("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(as_ctx(ctx_));
        ctx_ = nullptr;
        digest_failure("Failed to initialize SHA3-256");
    }
}

SHA3Hasher::~SHA3Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(as_ctx(ctx_));
    }
}

SHA3Hasher::SHA3Hasher(SHA3Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

SHA3Hasher& SHA3Hasher::operator=(SHA3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(as_ctx(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(std::string_view text) {
    update(text.data(), text.size());
}

void SHA3Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(as_ctx(ctx_), data, len) != 1) {
        digest_failure("SHA3-256 update failed");
    }
}

void SHA3Hasher::update_u64(std::uint64_t value) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), value);
    update(buf.data(), buf.size());
}

void SHA3Hasher::update_amount(const amount_t& value) {
    std::array<std::uint8_t, AMOUNT_SIZE> buf;
    encode_amount(buf.data(), value);
    update(buf.data(), buf.size());
}

hash_t SHA3Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(as_ctx(ctx_), result.data(), &len) != 1) {
        digest_failure("SHA3-256 finalize failed");
    }
    return result;
}

void SHA3Hasher::reset() {
    if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha3_256(), nullptr) != 1) {
        digest_failure("SHA3-256 reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t sha3_256(std::span<const std::uint8_t> data) {
    return sha3_256(data.data(), data.size());
}

hash_t sha3_256(const void* data, std::size_t len) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha3_256(), nullptr) != 1) {
        digest_failure("SHA3-256 failed");
    }
    return result;
}

// ============================================================================
// Merkle Root
// ============================================================================

hash_t hash_pair(const hash_t& left, const hash_t& right) {
    SHA3Hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

hash_t compute_merkle_root(std::span<const hash_t> leaves) {
    if (leaves.empty()) {
        return {};
    }
    if (leaves.size() == 1) {
        return leaves[0];
    }

    std::vector<hash_t> layer(leaves.begin(), leaves.end());

    while (layer.size() > 1) {
        std::vector<hash_t> next;
        next.reserve((layer.size() + 1) / 2);

        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const hash_t& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hash_pair(layer[i], right));
        }
        layer = std::move(next);
    }

    return layer[0];
}

}  // namespace pledge
