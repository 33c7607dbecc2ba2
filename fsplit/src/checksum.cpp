#include "checksum.hpp"
#include "util.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

Sha256::Sha256()
    : m_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
{
    if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw Error("Failed to initialize SHA-256 context");
    }
}

void Sha256::update(const void* data, size_t size)
{
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(m_ctx.get(), data, size) != 1) {
        throw Error("SHA-256 update failed");
    }
}

auto Sha256::hex_digest() -> std::string
{
    // NOLINTNEXTLINE(*-member-init)
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
    unsigned int digest_size = 0;
    if (EVP_DigestFinal_ex(m_ctx.get(), digest.data(), &digest_size) != 1) {
        throw Error("SHA-256 finalization failed");
    }
    return to_hex(digest.data(), digest_size);
}

auto checksum(const void* data, size_t size) -> std::string
{
    Sha256 hasher;
    hasher.update(data, size);
    return hasher.hex_digest();
}

auto checksum_file(const std::filesystem::path& path) -> std::string
{
    std::ifstream input{path, std::ios::in | std::ios::binary};
    if (!input) {
        throw Error("Failed to open file to calculate checksum: {}", path.string());
    }

    static constexpr size_t BLOCK_SIZE = 65536;
    std::array<char, BLOCK_SIZE> block{};
    Sha256 hasher;
    while (input) {
        input.read(block.data(), BLOCK_SIZE);
        hasher.update(block.data(), static_cast<size_t>(input.gcount()));
    }
    if (input.bad()) {
        throw Error("Failed to read file: {}", path.string());
    }
    return hasher.hex_digest();
}
