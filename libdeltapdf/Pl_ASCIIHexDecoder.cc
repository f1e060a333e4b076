#include <deltapdf/Pl_ASCIIHexDecoder.hh>

#include <deltapdf/Util.hh>

#include <stdexcept>

using namespace deltapdf;

Pl_ASCIIHexDecoder::Pl_ASCIIHexDecoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    util::assertion(next, "Attempt to create Pl_ASCIIHexDecoder with nullptr as next");
}

void
Pl_ASCIIHexDecoder::write(unsigned char const* buf, size_t len)
{
    if (eod) {
        return;
    }
    for (size_t i = 0; i < len; ++i) {
        char ch = static_cast<char>(buf[i]);
        if (ch == '>') {
            eod = true;
            flush();
            break;
        }
        if (util::is_space(ch) || ch == '\0') {
            continue;
        }
        if (!util::is_hex_digit(ch)) {
            throw std::runtime_error(
                std::string("character out of range during base Hex decode: ") + ch);
        }
        inbuf[pos++] = ch;
        if (pos == 2) {
            flush();
        }
    }
}

void
Pl_ASCIIHexDecoder::flush()
{
    if (pos == 0) {
        return;
    }
    // A missing second digit is 0.
    auto ch = static_cast<unsigned char>(
        (util::hex_decode_char(inbuf[0]) << 4) + util::hex_decode_char(inbuf[1]));
    next()->write(&ch, 1);

    pos = 0;
    inbuf[0] = '0';
    inbuf[1] = '0';
}

void
Pl_ASCIIHexDecoder::finish()
{
    flush();
    next()->finish();
}
