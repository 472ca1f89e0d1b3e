#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <macaddress/MacAddress.hpp>

namespace macaddress
{
namespace parser
{
    /** notation of a textual address, picked by its first separator */
    enum class AddressStyle
    {
        COLON,    // 6 groups of 2 digits, ':' separated
        HYPHEN,   // 6 groups of 2 digits, '-' separated
        DOT,      // 3 groups of 4 digits, '.' separated
        BARE_HEX  // 12 digits, optional 0x prefix
    };

    const char* address_style_to_string(AddressStyle style);

    /** returns std::nullopt for empty text only */
    std::optional<AddressStyle> detect_style(std::string_view text);

    std::optional<uint8_t> hex_digit_value(char c);

    ParseResult parse_grouped(std::string_view text, char separator,
        size_t num_groups, size_t digits_per_group);

    ParseResult parse_bare_hex(std::string_view text);

    ParseResult parse_address(std::string_view text);
} // namespace parser
} // namespace macaddress
