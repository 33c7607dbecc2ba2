#include "gzip.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace fsplit::test;

namespace {

auto compress(const std::vector<uint8_t>& bytes) -> std::string
{
    std::ostringstream output;
    const auto written = gzip_compress(bytes.data(), bytes.size(), output);
    auto text = output.str();
    assert(written == text.size());
    return text;
}

auto decompress(const std::string& text) -> std::vector<uint8_t>
{
    return gzip_decompress(text.data(), text.size());
}

}

int main() {
    // Compressible input larger than the codec's internal buffer.
    std::vector<uint8_t> text(300000);
    for (size_t i = 0; i < text.size(); ++i) {
        text[i] = static_cast<uint8_t>('a' + (i % 7));
    }
    const auto packed = compress(text);
    assert(packed.size() >= 18);
    assert(static_cast<uint8_t>(packed[0]) == 0x1f);
    assert(static_cast<uint8_t>(packed[1]) == 0x8b);
    assert(packed.size() < text.size());
    assert(decompress(packed) == text);

    const auto noise = random_bytes(100000, 3);
    assert(decompress(compress(noise)) == noise);

    // An empty payload still produces a complete gzip member.
    const auto empty = compress({});
    assert(!empty.empty());
    assert(decompress(empty).empty());

    // Concatenated members decode back to back.
    const std::vector<uint8_t> head = {'h', 'e', 'a', 'd'};
    const std::vector<uint8_t> tail = {'t', 'a', 'i', 'l'};
    const auto joined = decompress(compress(head) + compress(tail));
    assert((joined == std::vector<uint8_t>{'h', 'e', 'a', 'd', 't', 'a', 'i', 'l'}));

    assert(throws_error([&] { decompress(packed.substr(0, packed.size() / 2)); }));
    assert(throws_error([&] { decompress(""); }));
    assert(throws_error([&] { decompress("definitely not gzip"); }));

    auto damaged = compress(noise);
    damaged[damaged.size() / 2] = static_cast<char>(damaged[damaged.size() / 2] ^ 0xff);
    assert(throws_error([&] { decompress(damaged); }));

    return 0;
}
