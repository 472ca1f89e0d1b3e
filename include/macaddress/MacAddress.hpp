#pragma once

/**
 * @file MacAddress.hpp
 * @brief Defines the MacAddress class, an IEEE EUI-48 / MAC-48 address.
 *
 * A MacAddress is an immutable value of exactly 6 octets in network order
 * (octet 0 is transmitted first). It can be parsed from, and rendered to,
 * the following notations (hex digits are case-insensitive when parsing and
 * always upper case when rendering):
 *
 *   canonical     01:02:03:0A:0B:0F
 *   hex string    01-02-03-0A-0B-0F
 *   dot notation  0102.030A.0B0F
 *   hexadecimal   0x0102030A0B0F   (the 0x prefix is optional when parsing)
 */

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <slogger/ILogger.hpp>

#include <macaddress/ParseError.hpp>

namespace macaddress
{
enum class MacAddressFormat
{
    CANONICAL,
    HEX_STRING,
    DOT_NOTATION,
    HEXADECIMAL
};

struct ParseOptions
{
    /** strip leading/trailing whitespace (e.g. the newline at the end of
     * /sys/class/net/<iface>/address) before parsing */
    bool trim_whitespace = false;
};

class ParseResult;

class MacAddress
{
public:
    static constexpr size_t SIZE = 6;

    using octets_t = std::array<uint8_t, SIZE>;

    /** the nil address 00:00:00:00:00:00 */
    MacAddress()
    {
        m_octets.fill(0);
    }

    explicit MacAddress(const octets_t& octets)
        : m_octets(octets)
    {
    }

    static MacAddress from_octets(const octets_t& octets)
    {
        return MacAddress(octets);
    }

    static MacAddress nil()
    {
        return MacAddress();
    }

    static MacAddress zero()
    {
        return nil();
    }

    /** returns ff:ff:ff:ff:ff:ff */
    static MacAddress broadcast()
    {
        octets_t octets;
        octets.fill(0xFF);
        return MacAddress(octets);
    }

    /** Accepts any of the notations listed at the top of this file.
     * No whitespace is allowed unless options.trim_whitespace is set.
     */
    static ParseResult parse(std::string_view text);
    static ParseResult parse(std::string_view text, const ParseOptions& options);

    /** util func for the places where a failure only needs to be reported:
     * the parse error is logged and std::nullopt returned.
     */
    static std::optional<MacAddress> from_string(
        const std::string& text, logging::ILogger& logger,
        const ParseOptions& options = ParseOptions{});

    const octets_t& get_octets() const
    {
        return m_octets;
    }

    uint8_t operator[](size_t index) const
    {
        assert(index < SIZE);
        return m_octets[index];
    }

    /** the 48 bit value, octet 0 in the most significant position */
    uint64_t to_uint64() const;

    bool is_nil() const;
    bool is_broadcast() const;

    /** I/G bit of the first octet */
    bool is_multicast() const
    {
        return (m_octets[0] & GROUP_ADDRESS_BIT) != 0;
    }

    bool is_unicast() const
    {
        return !is_multicast();
    }

    /** U/L bit of the first octet */
    bool is_local() const
    {
        return (m_octets[0] & LOCAL_ADMIN_BIT) != 0;
    }

    bool is_universal() const
    {
        return !is_local();
    }

    /** Organizationally Unique Identifier, the first 3 octets */
    std::array<uint8_t, 3> oui() const
    {
        return { m_octets[0], m_octets[1], m_octets[2] };
    }

    /** Network Interface Controller specific part, the last 3 octets */
    std::array<uint8_t, 3> nic() const
    {
        return { m_octets[3], m_octets[4], m_octets[5] };
    }

    /** 01:02:03:0A:0B:0F */
    std::string to_canonical() const;

    /** 01-02-03-0A-0B-0F */
    std::string to_hex_string() const;

    /** 0102.030A.0B0F */
    std::string to_dot_string() const;

    /** 0x0102030A0B0F */
    std::string to_hexadecimal() const;

    std::string to_string(MacAddressFormat fmt) const;

    std::string to_string() const
    {
        return to_canonical();
    }

    bool operator==(const MacAddress& other) const
    {
        return m_octets == other.m_octets;
    }

    bool operator!=(const MacAddress& other) const
    {
        return !(*this == other);
    }

    bool operator<(const MacAddress& other) const
    {
        return m_octets < other.m_octets;
    }

    bool operator>(const MacAddress& other) const
    {
        return other < *this;
    }

    bool operator<=(const MacAddress& other) const
    {
        return !(other < *this);
    }

    bool operator>=(const MacAddress& other) const
    {
        return !(*this < other);
    }

    static constexpr uint8_t GROUP_ADDRESS_BIT = (1 << 0);
    static constexpr uint8_t LOCAL_ADMIN_BIT = (1 << 1);

private:
    octets_t m_octets;
};


/** Either the parsed address or the reason why parsing failed. */
class ParseResult
{
public:
    ParseResult(const MacAddress& address)
        : m_value(address)
    {
    }

    ParseResult(const ParseError& error)
        : m_value(error)
    {
    }

    bool has_value() const
    {
        return std::holds_alternative<MacAddress>(m_value);
    }

    explicit operator bool() const
    {
        return has_value();
    }

    const MacAddress& value() const
    {
        assert(has_value());
        return std::get<MacAddress>(m_value);
    }

    const ParseError& error() const
    {
        assert(!has_value());
        return std::get<ParseError>(m_value);
    }

    std::optional<MacAddress> to_optional() const
    {
        if (has_value())
        {
            return value();
        }
        return std::nullopt;
    }

private:
    std::variant<MacAddress, ParseError> m_value;
};


inline std::ostream& operator<<(std::ostream& stream, const MacAddress& address)
{
    stream << address.to_canonical();
    return stream;
}

inline std::ostream& operator<<(std::ostream& stream, const ParseError& error)
{
    stream << error.to_string();
    return stream;
}

} // namespace macaddress


template <>
struct std::hash<macaddress::MacAddress> {
    size_t operator()(const macaddress::MacAddress& address) const
    {
        return std::hash<uint64_t>{}(address.to_uint64());
    }
};

template <>
struct std::formatter<macaddress::MacAddress> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const macaddress::MacAddress& c, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", c.to_canonical());
    }
};
