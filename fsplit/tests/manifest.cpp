#include "manifest.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>

using namespace fsplit::test;

namespace {

const char* const SAMPLE = R"({
  "original_filename": "report.txt",
  "original_file_size": 25,
  "chunk_limit": 10,
  "chunks_sub_dir": "report.txt_parts",
  "chunks": [
    { "chunk_filename": "report.txt-001", "chunk_size": 10, "chunk_checksum": "aa" },
    { "chunk_filename": "report.txt-002", "chunk_size": 10, "chunk_checksum": null },
    { "chunk_filename": "report.txt-003", "chunk_size": 5 }
  ],
  "original_checksum": "ff",
  "is_compressed": false
})";

auto with_replaced(const std::string& from, const std::string& to) -> std::string
{
    std::string text = SAMPLE;
    const auto pos = text.find(from);
    assert(pos != std::string::npos);
    text.replace(pos, from.size(), to);
    return text;
}

auto rejected(const std::string& text) -> bool
{
    return throws_error([&] { Manifest::parse(text); });
}

}

int main() {
    const auto manifest = Manifest::parse(SAMPLE);
    assert(manifest.original_name == "report.txt");
    assert(manifest.original_size == 25);
    assert(manifest.chunk_limit == 10);
    assert(manifest.chunks_subdir == "report.txt_parts");
    assert(manifest.original_checksum == "ff");
    assert(!manifest.compressed);
    assert(manifest.chunks.size() == 3);
    assert(manifest.chunks[0].name == "report.txt-001");
    assert(manifest.chunks[0].stored_size == 10);
    assert(manifest.chunks[0].content_checksum == "aa");
    assert(!manifest.chunks[1].content_checksum.has_value());
    assert(!manifest.chunks[2].content_checksum.has_value());
    assert(manifest.file_name() == "report.txt.json");

    // Keys are written with their wire names, in schema order.
    const auto text = manifest.dump();
    const auto key_at = [&](const char* key) { return text.find(std::string("\"") + key + "\""); };
    assert(key_at("original_filename") < key_at("original_file_size"));
    assert(key_at("original_file_size") < key_at("chunk_limit"));
    assert(key_at("chunk_limit") < key_at("chunks_sub_dir"));
    assert(key_at("chunks_sub_dir") < key_at("chunks"));
    assert(key_at("chunks") < key_at("original_checksum"));
    assert(key_at("original_checksum") < key_at("is_compressed"));
    assert(text.find("\"chunk_checksum\": null") != std::string::npos);

    TempDir dir("manifest");
    manifest.save(dir.path() / manifest.file_name());
    const auto loaded = Manifest::load(dir.path() / manifest.file_name());
    assert(loaded.dump() == text);
    assert(loaded.chunks[2].stored_size == 5);

    assert(rejected("not json"));
    assert(rejected("[]"));
    assert(rejected(with_replaced(R"("original_checksum": "ff",)", "")));
    assert(rejected(with_replaced(R"("is_compressed": false)", R"("is_compressed": "no")")));
    assert(rejected(with_replaced(R"("original_file_size": 25)", R"("original_file_size": -25)")));
    assert(rejected(with_replaced(R"("chunk_limit": 10)", R"("chunk_limit": 0)")));
    assert(rejected(with_replaced(R"("chunk_checksum": "aa")", R"("chunk_checksum": 1)")));
    assert(rejected(with_replaced(R"("chunk_filename": "report.txt-001")", R"("chunk_filename": "../secret")")));
    assert(rejected(with_replaced(R"("chunks_sub_dir": "report.txt_parts")", R"("chunks_sub_dir": "/tmp")")));
    assert(rejected(with_replaced(R"("original_filename": "report.txt")", R"("original_filename": "..")")));
    assert(rejected(R"({"original_filename": "a", "original_file_size": 0, "chunk_limit": 1,
                        "chunks_sub_dir": "a_parts", "chunks": [], "original_checksum": "", "is_compressed": true})"));

    assert(throws_error([&] { Manifest::load(dir.path() / "missing.json"); }));

    assert(chunks_subdir_name("report.txt") == "report.txt_parts");
    assert(chunk_name("report.txt", 1) == "report.txt-001");
    assert(chunk_name("report.txt", 42) == "report.txt-042");
    assert(chunk_name("report.txt", 999) == "report.txt-999");
    assert(chunk_name("report.txt", 1000) == "report.txt-1000");

    assert(is_plain_name("report.txt"));
    assert(is_plain_name("..hidden"));
    assert(!is_plain_name(""));
    assert(!is_plain_name("."));
    assert(!is_plain_name("a/b"));
    assert(is_plain_name("a\\b"));
    assert(!is_plain_name(std::string("a\0b", 3)));

    return 0;
}
