#include <algorithm>
#include <cstdlib>

#include <slogger/StringUtils.hpp>

#include <macaddress/MacAddress.hpp>

#include "MacAddressParser.hpp"

namespace macaddress
{
uint64_t MacAddress::to_uint64() const
{
    uint64_t ret = 0;
    for (const auto octet : m_octets)
    {
        ret = (ret << 8) | octet;
    }
    return ret;
}

bool MacAddress::is_nil() const
{
    return std::all_of(m_octets.begin(), m_octets.end(),
        [](uint8_t b) { return b == 0; });
}

bool MacAddress::is_broadcast() const
{
    return std::all_of(m_octets.begin(), m_octets.end(),
        [](uint8_t b) { return b == 0xFF; });
}

std::string MacAddress::to_canonical() const
{
    return std::format("{:02X}:{:02X}:{:02X}:{:02X}:{:02X}:{:02X}",
        m_octets[0], m_octets[1], m_octets[2], m_octets[3], m_octets[4],
        m_octets[5]);
}

std::string MacAddress::to_hex_string() const
{
    return std::format("{:02X}-{:02X}-{:02X}-{:02X}-{:02X}-{:02X}",
        m_octets[0], m_octets[1], m_octets[2], m_octets[3], m_octets[4],
        m_octets[5]);
}

std::string MacAddress::to_dot_string() const
{
    return std::format("{:02X}{:02X}.{:02X}{:02X}.{:02X}{:02X}",
        m_octets[0], m_octets[1], m_octets[2], m_octets[3], m_octets[4],
        m_octets[5]);
}

std::string MacAddress::to_hexadecimal() const
{
    return std::format("0x{:02X}{:02X}{:02X}{:02X}{:02X}{:02X}",
        m_octets[0], m_octets[1], m_octets[2], m_octets[3], m_octets[4],
        m_octets[5]);
}

std::string MacAddress::to_string(MacAddressFormat fmt) const
{
    switch (fmt)
    {
    case MacAddressFormat::CANONICAL:
        return to_canonical();
    case MacAddressFormat::HEX_STRING:
        return to_hex_string();
    case MacAddressFormat::DOT_NOTATION:
        return to_dot_string();
    case MacAddressFormat::HEXADECIMAL:
        return to_hexadecimal();
    }
    abort();
}

ParseResult MacAddress::parse(std::string_view text)
{
    return parser::parse_address(text);
}

ParseResult MacAddress::parse(
    std::string_view text, const ParseOptions& options)
{
    if (options.trim_whitespace)
    {
        const std::string trimmed = StringUtils::trim(std::string(text));
        return parser::parse_address(trimmed);
    }
    return parser::parse_address(text);
}

std::optional<MacAddress> MacAddress::from_string(const std::string& text,
    logging::ILogger& logger, const ParseOptions& options)
{
    const auto result = parse(text, options);
    if (!result)
    {
        LOG_ERROR(logger, "invalid MAC address '{}': {}", text,
            result.error().to_string());
        return std::nullopt;
    }
    return result.value();
}
} // namespace macaddress
