#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Incremental SHA-256 over OpenSSL's EVP interface.
class Sha256
{
public:
    Sha256();
    void update(const void* data, size_t size);
    auto hex_digest() -> std::string;

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> m_ctx;
};

// Digest of zero bytes of input.
inline constexpr std::string_view EMPTY_CHECKSUM = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

auto checksum(const void* data, size_t size) -> std::string;

// Streams the file through the hasher in fixed-size blocks.
auto checksum_file(const std::filesystem::path& path) -> std::string;
