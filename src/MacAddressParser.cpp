#include <algorithm>
#include <cassert>
#include <cstdlib>

#include "MacAddressParser.hpp"

namespace macaddress
{
namespace parser
{
    namespace
    {
        constexpr std::string_view SEPARATORS = ":-.";

        // bare hex is exactly one hex digit per nibble
        constexpr size_t NUM_HEX_DIGITS = MacAddress::SIZE * 2;

        bool is_separator(char c)
        {
            return SEPARATORS.find(c) != std::string_view::npos;
        }

        bool has_hex_prefix(std::string_view text)
        {
            return text.size() >= 2 && text[0] == '0' &&
                (text[1] == 'x' || text[1] == 'X');
        }

        /** both digits have already been validated */
        uint8_t decode_octet(char high, char low)
        {
            return static_cast<uint8_t>(
                (*hex_digit_value(high) << 4) | *hex_digit_value(low));
        }
    } // namespace


    const char* address_style_to_string(AddressStyle style)
    {
        switch (style)
        {
        case AddressStyle::COLON:
            return "colon";
        case AddressStyle::HYPHEN:
            return "hyphen";
        case AddressStyle::DOT:
            return "dot";
        case AddressStyle::BARE_HEX:
            return "bare-hex";
        }
        abort();
    }

    std::optional<AddressStyle> detect_style(std::string_view text)
    {
        if (text.empty())
        {
            return std::nullopt;
        }

        const auto pos = text.find_first_of(SEPARATORS);
        if (pos == std::string_view::npos)
        {
            return AddressStyle::BARE_HEX;
        }

        switch (text[pos])
        {
        case ':':
            return AddressStyle::COLON;
        case '-':
            return AddressStyle::HYPHEN;
        default:
            return AddressStyle::DOT;
        }
    }

    std::optional<uint8_t> hex_digit_value(char c)
    {
        if (c >= '0' && c <= '9')
        {
            return static_cast<uint8_t>(c - '0');
        }
        if (c >= 'a' && c <= 'f')
        {
            return static_cast<uint8_t>(c - 'a' + 10);
        }
        if (c >= 'A' && c <= 'F')
        {
            return static_cast<uint8_t>(c - 'A' + 10);
        }
        return std::nullopt;
    }

    ParseResult parse_grouped(std::string_view text, char separator,
        size_t num_groups, size_t digits_per_group)
    {
        assert(num_groups * digits_per_group == NUM_HEX_DIGITS);
        assert(digits_per_group % 2 == 0);

        for (size_t i = 0; i < text.size(); i++)
        {
            const char c = text[i];
            if (c == separator || hex_digit_value(c).has_value())
            {
                continue;
            }
            if (is_separator(c))
            {
                return ParseError::mixed_separators(separator, c, i);
            }
            return ParseError::invalid_character(c, i);
        }

        const size_t found_groups =
            static_cast<size_t>(
                std::count(text.begin(), text.end(), separator)) + 1;
        if (found_groups != num_groups)
        {
            return ParseError::invalid_group_count(num_groups, found_groups);
        }

        MacAddress::octets_t octets{};
        size_t octet_index = 0;
        size_t group_start = 0;
        for (size_t group = 0; group < num_groups; group++)
        {
            size_t group_end = text.find(separator, group_start);
            if (group_end == std::string_view::npos)
            {
                group_end = text.size();
            }

            const auto digits = text.substr(group_start, group_end - group_start);
            if (digits.size() != digits_per_group)
            {
                return ParseError::invalid_group_length(
                    group_start, digits_per_group, digits.size());
            }

            for (size_t i = 0; i < digits.size(); i += 2)
            {
                octets[octet_index++] = decode_octet(digits[i], digits[i + 1]);
            }
            group_start = group_end + 1;
        }

        assert(octet_index == MacAddress::SIZE);
        return MacAddress(octets);
    }

    ParseResult parse_bare_hex(std::string_view text)
    {
        const size_t offset = has_hex_prefix(text) ? 2 : 0;
        const auto digits = text.substr(offset);

        for (size_t i = 0; i < digits.size(); i++)
        {
            if (!hex_digit_value(digits[i]).has_value())
            {
                return ParseError::invalid_character(digits[i], offset + i);
            }
        }

        if (digits.size() != NUM_HEX_DIGITS)
        {
            return ParseError::invalid_length(NUM_HEX_DIGITS, digits.size());
        }

        MacAddress::octets_t octets{};
        for (size_t i = 0; i < MacAddress::SIZE; i++)
        {
            octets[i] = decode_octet(digits[2 * i], digits[2 * i + 1]);
        }
        return MacAddress(octets);
    }

    ParseResult parse_address(std::string_view text)
    {
        const auto style = detect_style(text);
        if (!style)
        {
            return ParseError::empty_input();
        }

        switch (*style)
        {
        case AddressStyle::COLON:
            return parse_grouped(text, ':', 6, 2);
        case AddressStyle::HYPHEN:
            return parse_grouped(text, '-', 6, 2);
        case AddressStyle::DOT:
            return parse_grouped(text, '.', 3, 4);
        case AddressStyle::BARE_HEX:
            return parse_bare_hex(text);
        }
        abort();
    }
} // namespace parser
} // namespace macaddress
