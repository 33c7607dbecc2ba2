#include "split.hpp"
#include "checksum.hpp"
#include "gzip.hpp"
#include "util.hpp"

#include <mio/mmap.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>
#include <utility>

namespace {

auto write_chunk(const std::filesystem::path& path, const char* data, uint64_t size, bool compress) -> uint64_t
{
    // NOLINTNEXTLINE(*-signed-bitwise)
    std::ofstream output{path, std::ios::out | std::ios::trunc | std::ios::binary};
    if (!output) {
        throw Error("Failed to create chunk file: {}", path.string());
    }

    uint64_t stored_size = size;
    if (compress) {
        try {
            stored_size = gzip_compress(data, size, output);
        } catch (const Error& e) {
            throw Error("{}: {}", path.string(), e.what());
        }
    } else {
        output.write(data, static_cast<std::streamsize>(size));
    }

    output.close();
    if (!output) {
        throw Error("Failed to write chunk file: {}", path.string());
    }
    return stored_size;
}

}

auto split_file(const std::filesystem::path& path,
                uint64_t chunk_limit,
                const std::filesystem::path& output_root,
                bool compress,
                const Callbacks& callbacks) -> Manifest
{
    if (chunk_limit == 0) {
        throw Error("Chunk size limit must be positive: {}", path.string());
    }

    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        throw Error("Not a regular file: {}", path.string());
    }
    const auto original_size = std::filesystem::file_size(path, error);
    if (error) {
        throw Error("Failed to open file: {}: {}", path.string(), error.message());
    }

    // The manifest must be able to name the file and load it back.
    const auto name = path.filename().string();
    if (!is_plain_name(name) || !is_valid_utf8(name)) {
        throw Error("Invalid file name: {}", path.string());
    }

    Manifest manifest;
    manifest.original_name = name;
    manifest.original_size = original_size;
    manifest.chunk_limit = chunk_limit;
    manifest.chunks_subdir = chunks_subdir_name(manifest.original_name);
    manifest.compressed = compress;

    callbacks.report_message(std::format("Splitting '{}'", manifest.original_name));

    const auto chunks_dir = output_root / manifest.chunks_subdir;
    std::filesystem::create_directories(chunks_dir, error);
    if (error) {
        throw Error("Failed to create directory: {}: {}", chunks_dir.string(), error.message());
    }

    manifest.original_checksum = checksum_file(path);

    // Empty files cannot be mapped; they go through the loop as a single empty chunk.
    mio::mmap_source source;
    if (original_size > 0) {
        source.map(path.string(), error);
        if (error) {
            throw Error("Failed to open file: {}: {}", path.string(), error.message());
        }
    }

    const uint64_t available = source.size();
    uint64_t processed = 0;
    uint64_t sequence = 0;
    while (true) {
        const auto length = std::min(chunk_limit, available - processed);
        if (length == 0 && !manifest.chunks.empty()) {
            break;
        }

        ++sequence;
        // NOLINTNEXTLINE(*-pointer-arithmetic)
        const char* data = source.data() + processed;

        ChunkRecord chunk;
        chunk.name = chunk_name(manifest.original_name, sequence);
        chunk.content_checksum = checksum(data, length);
        chunk.stored_size = write_chunk(chunks_dir / chunk.name, data, length, compress);
        spdlog::debug("{}: {} bytes => {} ({} on disk)", manifest.original_name, length, chunk.name, chunk.stored_size);
        manifest.chunks.push_back(std::move(chunk));

        processed += length;
        callbacks.report_progress(processed, original_size);

        if (length < chunk_limit) {
            break;
        }
    }

    if (processed != original_size) {
        throw Error("File size mismatch during splitting: {}: expected {}, actual {}",
                    path.string(),
                    original_size,
                    processed);
    }

    callbacks.report_message(std::format("'{}' splitting complete", manifest.original_name));

    const auto manifest_path = chunks_dir / manifest.file_name();
    manifest.save(manifest_path);
    callbacks.report_message(
        std::format("Split info for '{}' saved to: {}", manifest.original_name, manifest_path.string()));

    return manifest;
}
