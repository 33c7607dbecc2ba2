#include "util.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

// NOLINTBEGIN(*-magic-numbers)
// NOLINTBEGIN(*-pointer-arithmetic)

// Rejects overlong forms, surrogates and code points past U+10FFFF.
auto is_valid_utf8(std::string_view text) -> bool
{
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<uint8_t>(text[i]);
        size_t length = 0;
        uint32_t code_point = 0;
        if (lead < 0x80U) {
            ++i;
            continue;
        }
        if ((lead & 0xe0U) == 0xc0U) {
            length = 2;
            code_point = lead & 0x1fU;
        } else if ((lead & 0xf0U) == 0xe0U) {
            length = 3;
            code_point = lead & 0x0fU;
        } else if ((lead & 0xf8U) == 0xf0U) {
            length = 4;
            code_point = lead & 0x07U;
        } else {
            return false;
        }
        if (text.size() - i < length) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<uint8_t>(text[i + k]);
            if ((next & 0xc0U) != 0x80U) {
                return false;
            }
            code_point = (code_point << 6U) | (next & 0x3fU);
        }

        static constexpr std::array<uint32_t, 5> MIN_CODE_POINT = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < MIN_CODE_POINT[length] || code_point > 0x10ffffU
            || (code_point >= 0xd800U && code_point <= 0xdfffU)) {
            return false;
        }
        i += length;
    }
    return true;
}

auto to_hex(const void* data, size_t size) -> std::string
{
    static constexpr std::array<char, 16> DIGITS = {
        '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    const auto* bytes = static_cast<const uint8_t*>(data);
    std::string result;
    result.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        result += DIGITS[bytes[i] >> 4U];
        result += DIGITS[bytes[i] & 0x0fU];
    }
    return result;
}

auto format_size(uint64_t bytes) -> std::string
{
    static constexpr std::array<const char*, 5> UNITS = {"B", "KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }

    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < UNITS.size()) {
        value /= 1024.0;
        ++unit;
    }
    return std::format("{:.1f} {}", value, UNITS[unit]);
}

// NOLINTEND(*-pointer-arithmetic)
// NOLINTEND(*-magic-numbers)
