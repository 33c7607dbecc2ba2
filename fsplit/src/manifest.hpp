#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ChunkRecord
{
    std::string name;
    // Bytes on disk, i.e. the compressed size when the manifest is compressed.
    uint64_t stored_size = 0;
    // SHA-256 of the uncompressed chunk bytes.
    std::optional<std::string> content_checksum;
};

// Describes how an original file was split and how to put it back together.
// Chunks are listed in reconstruction order.
struct Manifest
{
    std::string original_name;
    uint64_t original_size = 0;
    uint64_t chunk_limit = 0;
    std::string chunks_subdir;
    std::vector<ChunkRecord> chunks;
    std::string original_checksum;
    bool compressed = false;

    static auto parse(std::string_view text) -> Manifest;
    static auto load(const std::filesystem::path& path) -> Manifest;
    auto dump() const -> std::string;
    void save(const std::filesystem::path& path) const;

    // "<original_name>.json", stored inside chunks_subdir.
    auto file_name() const -> std::string;
};

auto chunks_subdir_name(std::string_view original_name) -> std::string;
auto chunk_name(std::string_view original_name, uint64_t sequence) -> std::string;

// True for a single path component that cannot escape its parent directory.
auto is_plain_name(std::string_view name) -> bool;
