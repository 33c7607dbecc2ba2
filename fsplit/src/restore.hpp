#pragma once

#include "callbacks.hpp"
#include "manifest.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// What to do when a chunk or the restored file does not match its recorded
// checksum. A size mismatch of the restored file is always fatal.
enum class IntegrityPolicy
{
    Warn,
    Abort,
};

struct RestoreOptions
{
    IntegrityPolicy policy = IntegrityPolicy::Warn;
};

struct RestoreReport
{
    std::filesystem::path output_path;
    uint64_t bytes_written = 0;
    // Chunks whose decoded content did not match content_checksum.
    std::vector<std::string> corrupt_chunks;
    bool checksum_matched = true;

    auto clean() const -> bool
    {
        return corrupt_chunks.empty() && checksum_matched;
    }
};

// Rebuilds `<output_dir>/<original_name>` from the chunks found under
// `<chunks_root>/<chunks_subdir>`.
auto restore_file(const Manifest& manifest,
                  const std::filesystem::path& chunks_root,
                  const std::filesystem::path& output_dir,
                  const RestoreOptions& options = {},
                  const Callbacks& callbacks = {}) -> RestoreReport;
