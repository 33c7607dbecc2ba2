#include "gzip.hpp"
#include "util.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <vector>

namespace {

// zlib window bits with the gzip wrapper selected.
constexpr int GZIP_WINDOW_BITS = 16 + MAX_WBITS;
constexpr int MEMORY_LEVEL = 8;
constexpr size_t BUFFER_SIZE = 65536;

// avail_in is a uInt, so large inputs are fed in slices.
constexpr size_t MAX_SLICE = size_t{1} << 30U;

class Input
{
public:
    explicit Input(const void* data, size_t size)
        : m_head(static_cast<const uint8_t*>(data))
        , m_remaining(size)
    {
    }

    void feed(z_stream& stream)
    {
        if (stream.avail_in != 0 || m_remaining == 0) {
            return;
        }
        const auto slice = std::min(m_remaining, MAX_SLICE);
        // NOLINTNEXTLINE(*-const-cast)
        stream.next_in = const_cast<Bytef*>(m_head);
        stream.avail_in = static_cast<uInt>(slice);
        // NOLINTNEXTLINE(*-pointer-arithmetic)
        m_head += slice;
        m_remaining -= slice;
    }

    auto exhausted(const z_stream& stream) const -> bool
    {
        return stream.avail_in == 0 && m_remaining == 0;
    }

private:
    const uint8_t* m_head;
    size_t m_remaining;
};

auto describe(const z_stream& stream, int code) -> const char*
{
    return stream.msg != nullptr ? stream.msg : zError(code);
}

}

auto gzip_compress(const void* data, size_t size, std::ostream& output) -> uint64_t
{
    z_stream stream{};
    const auto init = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, MEMORY_LEVEL,
                                   Z_DEFAULT_STRATEGY);
    if (init != Z_OK) {
        throw Error("Failed to initialize gzip encoder: {}", zError(init));
    }
    const auto guard = std::unique_ptr<z_stream, decltype(&deflateEnd)>(&stream, &deflateEnd);

    Input input(data, size);
    // NOLINTNEXTLINE(*-member-init)
    std::array<Bytef, BUFFER_SIZE> buffer;
    uint64_t written = 0;
    int result = Z_OK;
    do {
        input.feed(stream);
        const int flush = input.exhausted(stream) ? Z_FINISH : Z_NO_FLUSH;
        stream.next_out = buffer.data();
        stream.avail_out = BUFFER_SIZE;
        result = deflate(&stream, flush);
        if (result == Z_STREAM_ERROR) {
            throw Error("gzip compression failed: {}", describe(stream, result));
        }
        const auto produced = BUFFER_SIZE - stream.avail_out;
        // NOLINTNEXTLINE(*-reinterpret-cast)
        output.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(produced));
        written += produced;
    } while (result != Z_STREAM_END);

    if (!output) {
        throw Error("Failed to write compressed data");
    }
    return written;
}

auto gzip_decompress(const void* data, size_t size) -> std::vector<uint8_t>
{
    z_stream stream{};
    const auto init = inflateInit2(&stream, GZIP_WINDOW_BITS);
    if (init != Z_OK) {
        throw Error("Failed to initialize gzip decoder: {}", zError(init));
    }
    const auto guard = std::unique_ptr<z_stream, decltype(&inflateEnd)>(&stream, &inflateEnd);

    Input input(data, size);
    std::vector<uint8_t> result;
    while (true) {
        input.feed(stream);

        const auto offset = result.size();
        result.resize(offset + BUFFER_SIZE);
        // NOLINTNEXTLINE(*-pointer-arithmetic)
        stream.next_out = result.data() + offset;
        stream.avail_out = BUFFER_SIZE;
        const auto code = inflate(&stream, Z_NO_FLUSH);
        result.resize(offset + BUFFER_SIZE - stream.avail_out);

        if (code == Z_STREAM_END) {
            if (input.exhausted(stream)) {
                break;
            }
            inflateReset(&stream);
            continue;
        }
        if (code == Z_BUF_ERROR && input.exhausted(stream)) {
            throw Error("Truncated gzip stream");
        }
        if (code != Z_OK && code != Z_BUF_ERROR) {
            throw Error("Corrupt gzip stream: {}", describe(stream, code));
        }
    }
    return result;
}
