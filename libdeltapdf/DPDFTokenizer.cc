#include <deltapdf/DPDFTokenizer_private.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/Util.hh>

using namespace deltapdf;

using Token = DPDFTokenizer::Token;
using tt = DPDFTokenizer::token_type_e;

namespace
{
    // Classify a run of regular characters. Numbers have an optional sign and at least one digit
    // on either side of an optional decimal point. There is no exponent form.
    tt
    classify(std::string const& run)
    {
        if (run == "true" || run == "false") {
            return tt::tt_bool;
        }
        if (run == "null") {
            return tt::tt_null;
        }
        size_t i = (run[0] == '+' || run[0] == '-') ? 1 : 0;
        size_t digits = 0;
        bool point = false;
        for (; i < run.size(); ++i) {
            if (util::is_digit(run[i])) {
                ++digits;
            } else if (run[i] == '.' && !point) {
                point = true;
            } else {
                return tt::tt_word;
            }
        }
        if (digits == 0) {
            return tt::tt_word;
        }
        return point ? tt::tt_real : tt::tt_integer;
    }

    DPDFExc
    lex_error(InputSource& input, std::string const& context, Token const& token)
    {
        return {dpdf_e_lex, input.getName(), context, token.getOffset(), token.getErrorMessage()};
    }
} // namespace

DPDFTokenizer::Token::Token(token_type_e type, std::string const& value) :
    type(type),
    value(value),
    raw_value(value)
{
    if (type == tt_string) {
        raw_value = DPDFObjectHandle::newString(value).unparse();
    } else if (type == tt_name) {
        raw_value = DPDFObjectHandle::newName(value).unparse();
    }
}

DPDFTokenizer::DPDFTokenizer() :
    m(std::make_unique<deltapdf::Tokenizer>())
{
}

DPDFTokenizer::~DPDFTokenizer() = default;

Token
DPDFTokenizer::readToken(
    InputSource& input, std::string const& context, bool allow_bad, size_t max_len)
{
    return m->readToken(input, context, allow_bad, max_len);
}

Token
DPDFTokenizer::peekToken(InputSource& input, std::string const& context, bool allow_bad)
{
    auto pos = input.tell();
    auto last_offset = input.getLastOffset();
    auto token = m->readToken(input, context, true, 0);
    input.seek(pos, SEEK_SET);
    input.setLastOffset(last_offset);
    if (token.getType() == tt::tt_bad && !allow_bad) {
        throw lex_error(input, context, token);
    }
    return token;
}

Token
Tokenizer::readToken(InputSource& input, std::string const& context, bool allow_bad, size_t limit)
{
    type = tt::tt_bad;
    value.clear();
    error_message.clear();
    hex = false;
    max_len = limit;

    if (!skipSpace(input)) {
        auto offset = input.tell();
        input.setLastOffset(offset);
        return {tt::tt_eof, "", "", "", offset};
    }

    start = input.tell();
    char ch = '\0';
    input.read(&ch, 1);
    switch (ch) {
    case '[':
        type = tt::tt_array_open;
        break;
    case ']':
        type = tt::tt_array_close;
        break;
    case '(':
        scanLiteralString(input);
        break;
    case '<':
        scanLessThan(input);
        break;
    case '>':
        scanGreaterThan(input);
        break;
    case '/':
        scanName(input);
        break;
    case ')':
    case '{':
    case '}':
        bad("unexpected "s + ch);
        break;
    default:
        scanRegular(input);
        break;
    }

    auto raw = input.read(DIntC::to_size(input.tell() - start), start);
    input.setLastOffset(start);
    if (type == tt::tt_word) {
        type = classify(raw);
    }
    bool decoded = (type == tt::tt_name || type == tt::tt_string);
    Token token(type, decoded ? value : raw, raw, error_message, start, hex);
    if (type == tt::tt_bad && !allow_bad) {
        throw lex_error(input, context, token);
    }
    return token;
}

bool
Tokenizer::skipSpace(InputSource& input)
{
    char ch;
    while (input.read(&ch, 1) == 1) {
        if (ch == '%') {
            while (input.read(&ch, 1) == 1 && ch != '\r' && ch != '\n') {
            }
        } else if (ch != '\0' && !util::is_space(ch)) {
            input.unreadCh(ch);
            return true;
        }
    }
    return false;
}

bool
Tokenizer::next(InputSource& input, char& ch)
{
    if (max_len && DIntC::to_size(input.tell() - start) >= max_len) {
        bad("exceeded allowable length while reading token");
        return false;
    }
    return input.read(&ch, 1) == 1;
}

void
Tokenizer::bad(std::string const& message)
{
    type = tt::tt_bad;
    error_message = message;
}

void
Tokenizer::scanRegular(InputSource& input)
{
    char ch;
    while (next(input, ch)) {
        if (util::is_delimiter(ch)) {
            input.unreadCh(ch);
            break;
        }
    }
    if (error_message.empty()) {
        // classified by readToken once the raw text is known
        type = tt::tt_word;
    }
}

void
Tokenizer::scanLiteralString(InputSource& input)
{
    int depth = 1;
    char ch;
    while (next(input, ch)) {
        switch (ch) {
        case '\\':
            scanEscape(input);
            if (!error_message.empty()) {
                return;
            }
            break;

        case '(':
            ++depth;
            value += ch;
            break;

        case ')':
            if (--depth == 0) {
                type = tt::tt_string;
                return;
            }
            value += ch;
            break;

        case '\r':
            // CR and CRLF both read as LF
            value += '\n';
            if (char lf; next(input, lf) && lf != '\n') {
                input.unreadCh(lf);
            }
            break;

        default:
            value += ch;
            break;
        }
    }
    if (error_message.empty()) {
        bad("EOF while reading token");
    }
}

void
Tokenizer::scanEscape(InputSource& input)
{
    char ch;
    if (!next(input, ch)) {
        if (error_message.empty()) {
            bad("EOF while reading token");
        }
        return;
    }
    switch (ch) {
    case 'n':
        value += '\n';
        return;
    case 'r':
        value += '\r';
        return;
    case 't':
        value += '\t';
        return;
    case 'b':
        value += '\b';
        return;
    case 'f':
        value += '\f';
        return;
    case '\n':
        return;
    case '\r':
        if (char lf; next(input, lf) && lf != '\n') {
            input.unreadCh(lf);
        }
        return;
    default:
        break;
    }
    if (ch < '0' || ch > '7') {
        // A backslash before any other character is dropped.
        value += ch;
        return;
    }
    int code = ch - '0';
    for (int digits = 1; digits < 3; ++digits) {
        char d;
        if (!next(input, d)) {
            break;
        }
        if (d < '0' || d > '7') {
            input.unreadCh(d);
            break;
        }
        code = 8 * code + (d - '0');
    }
    // \ddd may exceed 255; the high-order bits are lost.
    value += static_cast<char>(code % 256);
}

void
Tokenizer::scanLessThan(InputSource& input)
{
    char ch;
    if (!next(input, ch)) {
        if (error_message.empty()) {
            bad("EOF while reading token");
        }
        return;
    }
    if (ch == '<') {
        type = tt::tt_dict_open;
        return;
    }

    hex = true;
    int high = -1;
    do {
        if (ch == '>') {
            if (high >= 0) {
                // An odd final digit is followed by an implied 0.
                value += static_cast<char>(high << 4);
            }
            type = tt::tt_string;
            return;
        }
        if (util::is_hex_digit(ch)) {
            int digit = util::hex_decode_char(ch);
            if (high < 0) {
                high = digit;
            } else {
                value += static_cast<char>((high << 4) | digit);
                high = -1;
            }
        } else if (ch != '\0' && !util::is_space(ch)) {
            bad("invalid character ("s + ch + ") in hexstring");
            return;
        }
    } while (next(input, ch));
    if (error_message.empty()) {
        bad("EOF while reading token");
    }
}

void
Tokenizer::scanGreaterThan(InputSource& input)
{
    char ch;
    if (!next(input, ch)) {
        if (error_message.empty()) {
            bad("EOF while reading token");
        }
        return;
    }
    if (ch == '>') {
        type = tt::tt_dict_close;
        return;
    }
    input.unreadCh(ch);
    bad("unexpected >");
}

void
Tokenizer::scanName(InputSource& input)
{
    value = "/";
    bool null_char = false;
    char ch;
    while (next(input, ch)) {
        if (util::is_delimiter(ch)) {
            input.unreadCh(ch);
            break;
        }
        if (ch != '#') {
            value += ch;
            continue;
        }
        // #xx is a character code. A # not followed by two hex digits is kept as it is.
        char h1;
        char h2;
        if (!next(input, h1)) {
            value += '#';
            break;
        }
        if (!util::is_hex_digit(h1)) {
            value += '#';
            input.unreadCh(h1);
            continue;
        }
        if (!next(input, h2)) {
            value += '#';
            value += h1;
            break;
        }
        if (!util::is_hex_digit(h2)) {
            value += '#';
            value += h1;
            input.unreadCh(h2);
            continue;
        }
        auto code = static_cast<char>((util::hex_decode_char(h1) << 4) | util::hex_decode_char(h2));
        if (code == '\0') {
            null_char = true;
            value += "#00";
        } else {
            value += code;
        }
    }
    if (!error_message.empty()) {
        return;
    }
    if (null_char) {
        bad("null character not allowed in name token");
    } else {
        type = tt::tt_name;
    }
}
