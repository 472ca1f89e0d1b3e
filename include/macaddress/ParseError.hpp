#pragma once

/**
 * @file ParseError.hpp
 * @brief Describes why a textual MAC address could not be parsed.
 */

#include <cstddef>
#include <format>
#include <string>

namespace macaddress
{
class ParseError
{
public:
    enum class Kind
    {
        EMPTY_INPUT,

        // bare hex form with other than 12 digits
        INVALID_LENGTH,

        INVALID_GROUP_COUNT,
        INVALID_GROUP_LENGTH,
        INVALID_CHARACTER,
        MIXED_SEPARATORS
    };

    ParseError(Kind kind, size_t position, size_t expected = 0,
        size_t found = 0, char character = '\0', char separator = '\0')
        : m_kind(kind)
        , m_position(position)
        , m_expected(expected)
        , m_found(found)
        , m_character(character)
        , m_separator(separator)
    {
    }

    static ParseError empty_input()
    {
        return ParseError(Kind::EMPTY_INPUT, 0);
    }

    static ParseError invalid_length(size_t expected, size_t found)
    {
        return ParseError(Kind::INVALID_LENGTH, 0, expected, found);
    }

    static ParseError invalid_group_count(size_t expected, size_t found)
    {
        return ParseError(Kind::INVALID_GROUP_COUNT, 0, expected, found);
    }

    /** @param position offset of the first character of the group */
    static ParseError invalid_group_length(
        size_t position, size_t expected, size_t found)
    {
        return ParseError(
            Kind::INVALID_GROUP_LENGTH, position, expected, found);
    }

    static ParseError invalid_character(char c, size_t position)
    {
        return ParseError(Kind::INVALID_CHARACTER, position, 0, 0, c);
    }

    /** @param separator the separator that the input started out with */
    static ParseError mixed_separators(
        char separator, char other, size_t position)
    {
        return ParseError(
            Kind::MIXED_SEPARATORS, position, 0, 0, other, separator);
    }

    Kind get_kind() const
    {
        return m_kind;
    }

    size_t get_position() const
    {
        return m_position;
    }

    /** number of groups or digits that were expected */
    size_t get_expected() const
    {
        return m_expected;
    }

    /** number of groups or digits that were found */
    size_t get_found() const
    {
        return m_found;
    }

    /** offending character for INVALID_CHARACTER and MIXED_SEPARATORS */
    char get_character() const
    {
        return m_character;
    }

    /** separator the input was expected to use, for MIXED_SEPARATORS */
    char get_separator() const
    {
        return m_separator;
    }

    std::string to_string() const;

    bool operator==(const ParseError& other) const = default;

private:
    Kind m_kind;
    size_t m_position;
    size_t m_expected;
    size_t m_found;
    char m_character;
    char m_separator;
};

const char* parse_error_kind_to_string(ParseError::Kind kind);

} // namespace macaddress


template <>
struct std::formatter<macaddress::ParseError::Kind> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(macaddress::ParseError::Kind k, std::format_context& ctx) const {
        return std::format_to(
            ctx.out(), "{}", macaddress::parse_error_kind_to_string(k));
    }
};

template <>
struct std::formatter<macaddress::ParseError> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const macaddress::ParseError& e, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", e.to_string());
    }
};
