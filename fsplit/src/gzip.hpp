#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

// Writes `data` to `output` as a single gzip member and returns the number of
// bytes written.
auto gzip_compress(const void* data, size_t size, std::ostream& output) -> uint64_t;

// Inflates a gzip stream. Concatenated members are decoded back to back.
auto gzip_decompress(const void* data, size_t size) -> std::vector<uint8_t>;
