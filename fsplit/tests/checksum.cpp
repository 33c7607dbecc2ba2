#include "checksum.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace fsplit::test;

int main() {
    assert(checksum(nullptr, 0) == EMPTY_CHECKSUM);
    assert(checksum("", 0) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    const std::string abc = "abc";
    assert(checksum(abc.data(), abc.size()) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    const auto bytes = random_bytes(4096, 7);
    const auto first = checksum(bytes.data(), bytes.size());
    assert(first == checksum(bytes.data(), bytes.size()));
    assert(first.size() == 64);
    assert(first != checksum(bytes.data(), bytes.size() - 1));

    // Incremental updates agree with the one-shot digest.
    Sha256 hasher;
    hasher.update(bytes.data(), 1000);
    hasher.update(bytes.data() + 1000, bytes.size() - 1000);
    assert(hasher.hex_digest() == first);

    TempDir dir("checksum");

    // Larger than one read block, not a multiple of it.
    const auto large = random_bytes(200001, 11);
    write_file(dir.path() / "large.bin", large);
    assert(checksum_file(dir.path() / "large.bin") == checksum(large.data(), large.size()));

    write_file(dir.path() / "empty.bin", {});
    assert(checksum_file(dir.path() / "empty.bin") == EMPTY_CHECKSUM);

    assert(throws_error([&] { checksum_file(dir.path() / "missing.bin"); }));

    return 0;
}
