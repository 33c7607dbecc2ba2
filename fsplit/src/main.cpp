#include "main.hpp"
#include "manifest.hpp"
#include "restore.hpp"
#include "split.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

auto make_callbacks(const std::string& name) -> Callbacks
{
    Callbacks callbacks;
    callbacks.progress = [name](uint64_t done, uint64_t total) {
        spdlog::debug("{}: {} / {}", name, format_size(done), format_size(total));
    };
    callbacks.message = [](const std::string& text) {
        spdlog::info("{}", text);
    };
    return callbacks;
}

// ---------------------------------------------------------
// Command: split
// ---------------------------------------------------------

namespace commands::split {

constexpr uint64_t DEFAULT_SIZE_LIMIT = 100 * 1024 * 1024;

struct Args
{
    std::vector<std::filesystem::path> paths;
    std::filesystem::path dest = ".";
    uint64_t size_limit = DEFAULT_SIZE_LIMIT;
    bool compress = false;
};

void exec(const Args& args)
{
    for (const auto& path : args.paths) {
        const auto manifest =
            split_file(path, args.size_limit, args.dest, args.compress, make_callbacks(path.filename().string()));
        std::cout << std::format("{} => {} ({} chunks)\n",
                                 path.string(),
                                 (args.dest / manifest.chunks_subdir).lexically_normal().string(),
                                 manifest.chunks.size());
    }
}

}

// ---------------------------------------------------------
// Command: restore
// ---------------------------------------------------------

namespace commands::restore {

struct Args
{
    std::vector<std::filesystem::path> paths;
    std::filesystem::path source = ".";
    std::filesystem::path dest = ".";
    bool strict = false;
};

void exec(const Args& args)
{
    if (!std::filesystem::exists(args.dest)) {
        std::error_code error;
        std::filesystem::create_directories(args.dest, error);
        if (error) {
            throw Error("Failed to create directory: {}: {}", args.dest.string(), error.message());
        }
    }

    RestoreOptions options;
    options.policy = args.strict ? IntegrityPolicy::Abort : IntegrityPolicy::Warn;

    for (const auto& path : args.paths) {
        const auto manifest = Manifest::load(path);
        const auto report =
            restore_file(manifest, args.source, args.dest, options, make_callbacks(manifest.original_name));
        std::cout << std::format("{} => {}{}\n",
                                 path.string(),
                                 report.output_path.lexically_normal().string(),
                                 report.clean() ? "" : " (checksum mismatch)");
    }
}

}

// ---------------------------------------------------------
// Command: list
// ---------------------------------------------------------

namespace commands::list {

struct Args
{
    std::vector<std::filesystem::path> paths;
};

void exec(const Args& args)
{
    for (const auto& path : args.paths) {
        const auto manifest = Manifest::load(path);
        std::cout << std::format("{}: {} ({} bytes), {} chunks of at most {}{}\n",
                                 manifest.original_name,
                                 format_size(manifest.original_size),
                                 manifest.original_size,
                                 manifest.chunks.size(),
                                 format_size(manifest.chunk_limit),
                                 manifest.compressed ? ", gzip" : "");
        for (const auto& chunk : manifest.chunks) {
            std::cout << std::format("  {}/{}  {}  {}\n",
                                     manifest.chunks_subdir,
                                     chunk.name,
                                     chunk.stored_size,
                                     chunk.content_checksum.value_or("-"));
        }
    }
}

}

}

// ---------------------------------------------------------
// Main
// ---------------------------------------------------------

auto main(int argc, const char* argv[]) -> int
try {
    auto stderr_logger = spdlog::stderr_color_mt("fsplit");
    spdlog::set_default_logger(stderr_logger);
    spdlog::set_pattern("[%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    constexpr auto VERSION = build::version();

    CLI::App cli;
    cli.description("Split large files into chunks and restore them");
    cli.name("fsplit");
    cli.set_version_flag("-v, --version",
                         std::format("{}.{}.{}", VERSION.major, VERSION.minor, VERSION.patch),
                         "Print version information and exit");
    cli.failure_message(CLI::FailureMessage::simple);
    cli.require_subcommand(1);
    cli.positionals_at_end();
    cli.validate_positionals();

    bool verbose = false;
    bool debug = false;
    cli.add_flag("--verbose", verbose, "Report progress messages");
    cli.add_flag("--debug", debug, "Report every chunk");

    commands::split::Args split_args;
    auto* split_cmd = cli.add_subcommand("split", "Split files into chunks");
    split_cmd->add_option("-s,--size-limit", split_args.size_limit, "Maximum chunk size (accepts K, M, G suffixes)")
        ->transform(CLI::AsSizeValue(false))
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    split_cmd->add_option("-o,--output-dir", split_args.dest, "Root directory for chunk directories");
    split_cmd->add_flag("-c,--compress", split_args.compress, "Gzip every chunk");
    split_cmd->add_option("FILE", split_args.paths, "Files to split")->required()->check(CLI::ExistingFile);

    commands::restore::Args restore_args;
    auto* restore_cmd = cli.add_subcommand("restore", "Restore files from their manifests");
    restore_cmd->add_option("-i,--input-dir", restore_args.source, "Root directory holding the chunk directories")
        ->check(CLI::ExistingDirectory);
    restore_cmd->add_option("-o,--output-dir", restore_args.dest, "Directory for restored files");
    restore_cmd->add_flag("--strict", restore_args.strict, "Fail on checksum mismatches instead of warning");
    restore_cmd->add_option("MANIFEST", restore_args.paths, "Manifests to restore from")
        ->required()
        ->check(CLI::ExistingFile);

    commands::list::Args list_args;
    auto* list_cmd = cli.add_subcommand("list", "List the chunks recorded in manifests");
    list_cmd->add_option("MANIFEST", list_args.paths, "Manifests to list")->required()->check(CLI::ExistingFile);

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e);
    }

    if (debug) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::info);
    }

    for (auto* command : cli.get_subcommands()) {
        if (command == split_cmd) {
            commands::split::exec(split_args);
        } else if (command == restore_cmd) {
            commands::restore::exec(restore_args);
        } else if (command == list_cmd) {
            commands::list::exec(list_args);
        }
    }

    return EXIT_SUCCESS;
} catch (const Error& e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
} catch (const std::exception& e) {
    spdlog::critical("An unexpected exception occurred: {}", e.what());
    return EXIT_FAILURE;
}
