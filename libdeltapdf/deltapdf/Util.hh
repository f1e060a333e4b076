#ifndef UTIL_HH
#define UTIL_HH

#include <stdexcept>
#include <string>

using namespace std::literals;

namespace deltapdf::util
{
    // deltapdf::util is a collection of inline helpers for internal use. Character classes here
    // follow the PDF definitions and deliberately ignore the C locale.

    // Throw a logic_error if 'cond' does not hold.
    inline void
    assertion(bool cond, std::string const& msg)
    {
        if (!cond) {
            throw std::logic_error(msg);
        }
    }

    inline void
    internal_error_if(bool cond, std::string const& msg)
    {
        if (cond) {
            throw std::logic_error("INTERNAL ERROR: "s.append(msg).append(
                "\nThis is a deltapdf bug."));
        }
    }

    inline constexpr char
    hex_decode_char(char digit)
    {
        return digit <= '9' && digit >= '0'
            ? char(digit - '0')
            : (digit >= 'a' && digit <= 'f'
                   ? char(digit - 'a' + 10)
                   : (digit >= 'A' && digit <= 'F' ? char(digit - 'A' + 10) : '\20'));
    }

    inline constexpr bool
    is_hex_digit(char ch)
    {
        return hex_decode_char(ch) < '\20';
    }

    // PDF white-space characters. NUL is white space in PDF as well, which the tokenizer handles
    // separately.
    inline constexpr bool
    is_space(char ch)
    {
        return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f' || ch == '\v';
    }

    inline bool
    is_digit(char ch)
    {
        return (ch >= '0' && ch <= '9');
    }

    inline constexpr bool
    is_delimiter(char ch)
    {
        return (
            ch == ' ' || ch == '\n' || ch == '/' || ch == '(' || ch == ')' || ch == '{' ||
            ch == '}' || ch == '<' || ch == '>' || ch == '[' || ch == ']' || ch == '%' ||
            ch == '\t' || ch == '\r' || ch == '\v' || ch == '\f' || ch == 0);
    }

    // Returns lower-case hex-encoded version of the char including a leading "#".
    inline std::string
    hex_encode_char(char c)
    {
        static auto constexpr hexchars = "0123456789abcdef";
        return {'#', hexchars[static_cast<unsigned char>(c) >> 4], hexchars[c & 0x0f]};
    }
} // namespace deltapdf::util

#endif // UTIL_HH
