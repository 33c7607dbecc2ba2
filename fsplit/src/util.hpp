#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

class Error : public std::runtime_error
{
public:
    template<typename... T>
    explicit Error(std::format_string<T...> fmt, T&&... args)
        : std::runtime_error(std::format(fmt, std::forward<T>(args)...))
    {
    }
};

auto is_valid_utf8(std::string_view text) -> bool;

auto to_hex(const void* data, size_t size) -> std::string;

// Renders a byte count with a binary unit suffix, e.g. "1.5 MiB".
auto format_size(uint64_t bytes) -> std::string;
