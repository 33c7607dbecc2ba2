#pragma once

#include "callbacks.hpp"
#include "manifest.hpp"

#include <cstdint>
#include <filesystem>

// Splits `path` into chunks of at most `chunk_limit` bytes under
// `<output_root>/<name>_parts`, gzip-compressing each chunk when `compress` is
// set, and writes the manifest `<name>.json` next to them.
//
// A failure leaves whatever chunks were already written and no manifest.
auto split_file(const std::filesystem::path& path,
                uint64_t chunk_limit,
                const std::filesystem::path& output_root,
                bool compress,
                const Callbacks& callbacks = {}) -> Manifest;
