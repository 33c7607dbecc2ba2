#include "restore.hpp"
#include "checksum.hpp"
#include "gzip.hpp"
#include "util.hpp"

#include <mio/mmap.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

void integrity_failure(const RestoreOptions& options, const std::string& text)
{
    if (options.policy == IntegrityPolicy::Abort) {
        throw Error("{}", text);
    }
    spdlog::warn("{}", text);
}

// Decodes one chunk file and hands the plaintext to `consume`.
template<typename Consumer>
void read_chunk(const std::filesystem::path& path, bool compressed, Consumer&& consume)
{
    std::error_code error;
    const auto size = std::filesystem::file_size(path, error);
    if (error) {
        throw Error("Failed to open chunk file: {}: {}", path.string(), error.message());
    }

    mio::mmap_source mmap;
    if (size > 0) {
        mmap.map(path.string(), error);
        if (error) {
            throw Error("Failed to open chunk file: {}: {}", path.string(), error.message());
        }
    }

    if (!compressed) {
        consume(mmap.data(), mmap.size());
        return;
    }

    std::vector<uint8_t> plain;
    try {
        plain = gzip_decompress(mmap.data(), mmap.size());
    } catch (const Error& e) {
        throw Error("{}: {}", path.string(), e.what());
    }
    consume(plain.data(), plain.size());
}

}

auto restore_file(const Manifest& manifest,
                  const std::filesystem::path& chunks_root,
                  const std::filesystem::path& output_dir,
                  const RestoreOptions& options,
                  const Callbacks& callbacks) -> RestoreReport
{
    const auto chunks_dir = chunks_root / manifest.chunks_subdir;
    std::error_code error;
    if (!std::filesystem::is_directory(chunks_dir, error)) {
        throw Error("Chunk directory for '{}' not found: {}", manifest.original_name, chunks_dir.string());
    }

    RestoreReport report;
    report.output_path = output_dir / manifest.original_name;

    // NOLINTNEXTLINE(*-signed-bitwise)
    std::ofstream output{report.output_path, std::ios::out | std::ios::trunc | std::ios::binary};
    if (!output) {
        throw Error("Failed to create output file: {}", report.output_path.string());
    }

    callbacks.report_message(std::format("Restoring '{}'", manifest.original_name));

    for (const auto& chunk : manifest.chunks) {
        read_chunk(chunks_dir / chunk.name, manifest.compressed, [&](const void* data, size_t size) {
            if (chunk.content_checksum.has_value()) {
                const auto actual = checksum(data, size);
                if (actual != chunk.content_checksum.value()) {
                    report.corrupt_chunks.push_back(chunk.name);
                    integrity_failure(options,
                                      std::format("Checksum mismatch for chunk '{}': expected {}, actual {}",
                                                  chunk.name,
                                                  chunk.content_checksum.value(),
                                                  actual));
                }
            }

            output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
            if (!output) {
                throw Error("Failed to write output file: {}", report.output_path.string());
            }
            report.bytes_written += size;
        });

        spdlog::debug("{}: restored {} ({} bytes so far)", manifest.original_name, chunk.name, report.bytes_written);
        callbacks.report_progress(report.bytes_written, manifest.original_size);
    }

    output.close();
    if (!output) {
        throw Error("Failed to write output file: {}", report.output_path.string());
    }

    callbacks.report_message(std::format("'{}' restoration complete", manifest.original_name));

    const auto restored_size = std::filesystem::file_size(report.output_path, error);
    if (error) {
        throw Error("Failed to stat restored file: {}: {}", report.output_path.string(), error.message());
    }
    if (restored_size != manifest.original_size) {
        throw Error("Restored file size mismatch: {}: expected {}, actual {}",
                    report.output_path.string(),
                    manifest.original_size,
                    restored_size);
    }

    const auto actual = checksum_file(report.output_path);
    if (actual != manifest.original_checksum) {
        report.checksum_matched = false;
        integrity_failure(options,
                          std::format("Checksum mismatch for restored file '{}': expected {}, actual {}",
                                      manifest.original_name,
                                      manifest.original_checksum,
                                      actual));
    }

    return report;
}
