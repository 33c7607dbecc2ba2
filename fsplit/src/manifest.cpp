#include "manifest.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

// Keeps keys in schema order when writing.
using Json = nlohmann::ordered_json;

auto get_string(const Json& object, const char* key) -> std::string
{
    const auto& value = object.at(key);
    if (!value.is_string()) {
        throw Error("'{}' must be a string", key);
    }
    return value.get<std::string>();
}

auto get_u64(const Json& object, const char* key) -> uint64_t
{
    const auto& value = object.at(key);
    if (!value.is_number_unsigned()) {
        throw Error("'{}' must be a non-negative integer", key);
    }
    return value.get<uint64_t>();
}

auto get_name(const Json& object, const char* key) -> std::string
{
    auto name = get_string(object, key);
    if (!is_plain_name(name)) {
        throw Error("'{}' is not a plain file name: \"{}\"", key, name);
    }
    return name;
}

auto chunk_to_json(const ChunkRecord& chunk) -> Json
{
    Json object;
    object["chunk_filename"] = chunk.name;
    object["chunk_size"] = chunk.stored_size;
    if (chunk.content_checksum.has_value()) {
        object["chunk_checksum"] = chunk.content_checksum.value();
    } else {
        object["chunk_checksum"] = nullptr;
    }
    return object;
}

auto chunk_from_json(const Json& object) -> ChunkRecord
{
    if (!object.is_object()) {
        throw Error("chunk entries must be objects");
    }

    ChunkRecord chunk;
    chunk.name = get_name(object, "chunk_filename");
    chunk.stored_size = get_u64(object, "chunk_size");

    // An absent key reads the same as null.
    const auto checksum = object.find("chunk_checksum");
    if (checksum != object.end() && !checksum->is_null()) {
        if (!checksum->is_string()) {
            throw Error("'chunk_checksum' must be a string or null");
        }
        chunk.content_checksum = checksum->get<std::string>();
    }
    return chunk;
}

}

auto Manifest::parse(std::string_view text) -> Manifest
{
    try {
        const auto root = Json::parse(text);
        if (!root.is_object()) {
            throw Error("top-level value must be an object");
        }

        Manifest manifest;
        manifest.original_name = get_name(root, "original_filename");
        manifest.original_size = get_u64(root, "original_file_size");
        manifest.chunk_limit = get_u64(root, "chunk_limit");
        manifest.chunks_subdir = get_name(root, "chunks_sub_dir");
        manifest.original_checksum = get_string(root, "original_checksum");

        const auto& compressed = root.at("is_compressed");
        if (!compressed.is_boolean()) {
            throw Error("'is_compressed' must be a boolean");
        }
        manifest.compressed = compressed.get<bool>();

        const auto& chunks = root.at("chunks");
        if (!chunks.is_array()) {
            throw Error("'chunks' must be an array");
        }
        for (const auto& chunk : chunks) {
            manifest.chunks.push_back(chunk_from_json(chunk));
        }

        if (manifest.chunks.empty()) {
            throw Error("'chunks' must not be empty");
        }
        if (manifest.chunk_limit == 0) {
            throw Error("'chunk_limit' must be positive");
        }
        return manifest;
    } catch (const Json::exception& e) {
        throw Error("{}", e.what());
    }
}

auto Manifest::load(const std::filesystem::path& path) -> Manifest
{
    std::ifstream input{path, std::ios::in | std::ios::binary};
    if (!input) {
        throw Error("Failed to read manifest: {}", path.string());
    }
    const std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        throw Error("Failed to read manifest: {}", path.string());
    }

    try {
        return parse(text);
    } catch (const Error& e) {
        throw Error("Invalid manifest: {}: {}", path.string(), e.what());
    }
}

auto Manifest::dump() const -> std::string
{
    Json chunk_list = Json::array();
    for (const auto& chunk : chunks) {
        chunk_list.push_back(chunk_to_json(chunk));
    }

    Json root;
    root["original_filename"] = original_name;
    root["original_file_size"] = original_size;
    root["chunk_limit"] = chunk_limit;
    root["chunks_sub_dir"] = chunks_subdir;
    root["chunks"] = std::move(chunk_list);
    root["original_checksum"] = original_checksum;
    root["is_compressed"] = compressed;

    try {
        return root.dump(2);
    } catch (const Json::exception& e) {
        throw Error("Failed to serialize manifest for '{}': {}", original_name, e.what());
    }
}

void Manifest::save(const std::filesystem::path& path) const
{
    const auto text = dump();

    // NOLINTNEXTLINE(*-signed-bitwise)
    std::ofstream output{path, std::ios::out | std::ios::trunc | std::ios::binary};
    if (!output) {
        throw Error("Failed to create manifest: {}", path.string());
    }
    output.write(text.data(), static_cast<std::streamsize>(text.size()));
    output.close();
    if (!output) {
        throw Error("Failed to save manifest: {}", path.string());
    }
}

auto Manifest::file_name() const -> std::string
{
    return original_name + ".json";
}

auto chunks_subdir_name(std::string_view original_name) -> std::string
{
    return std::format("{}_parts", original_name);
}

auto chunk_name(std::string_view original_name, uint64_t sequence) -> std::string
{
    return std::format("{}-{:03}", original_name, sequence);
}

auto is_plain_name(std::string_view name) -> bool
{
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string_view("/\0", 2)) == std::string_view::npos;
}
