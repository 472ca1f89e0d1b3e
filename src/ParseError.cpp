#include <cctype>
#include <cstdlib>

#include <macaddress/ParseError.hpp>

namespace macaddress
{
namespace
{
    std::string printable(char c)
    {
        if (std::isprint(static_cast<unsigned char>(c)))
        {
            return std::string(1, c);
        }
        return std::format("\\x{:02X}", static_cast<unsigned char>(c));
    }
} // namespace

const char* parse_error_kind_to_string(ParseError::Kind kind)
{
    switch (kind)
    {
    case ParseError::Kind::EMPTY_INPUT:
        return "empty-input";
    case ParseError::Kind::INVALID_LENGTH:
        return "invalid-length";
    case ParseError::Kind::INVALID_GROUP_COUNT:
        return "invalid-group-count";
    case ParseError::Kind::INVALID_GROUP_LENGTH:
        return "invalid-group-length";
    case ParseError::Kind::INVALID_CHARACTER:
        return "invalid-character";
    case ParseError::Kind::MIXED_SEPARATORS:
        return "mixed-separators";
    }
    abort();
}

std::string ParseError::to_string() const
{
    switch (m_kind)
    {
    case Kind::EMPTY_INPUT:
        return "empty input; expecting a MAC address";
    case Kind::INVALID_LENGTH:
        return std::format(
            "invalid length; expecting {} hex digits, found {}", m_expected,
            m_found);
    case Kind::INVALID_GROUP_COUNT:
        return std::format(
            "invalid group count; expecting {} groups, found {}", m_expected,
            m_found);
    case Kind::INVALID_GROUP_LENGTH:
        return std::format("invalid group length at offset {}; expecting {} "
                           "hex digits, found {}",
            m_position, m_expected, m_found);
    case Kind::INVALID_CHARACTER:
        return std::format("invalid character; found '{}' at offset {}",
            printable(m_character), m_position);
    case Kind::MIXED_SEPARATORS:
        return std::format(
            "mixed separators; expecting '{}', found '{}' at offset {}",
            m_separator, m_character, m_position);
    }
    abort();
}
} // namespace macaddress
