#include <deltapdf/Pl_ASCIIHexEncoder.hh>

#include <deltapdf/Util.hh>

#include <stdexcept>

using namespace deltapdf;

Pl_ASCIIHexEncoder::Pl_ASCIIHexEncoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    util::assertion(next, "Attempt to create Pl_ASCIIHexEncoder with nullptr as next");
}

void
Pl_ASCIIHexEncoder::write(unsigned char const* buf, size_t len)
{
    if (finished) {
        throw std::logic_error(identifier + ": write() called after finish()");
    }
    static auto constexpr hexchars = "0123456789abcdef";
    std::string out;
    out.reserve(2 * len + len / 32 + 1);
    for (size_t i = 0; i < len; ++i) {
        if (line_length == 64) {
            out += '\n';
            line_length = 0;
        }
        out += hexchars[buf[i] >> 4];
        out += hexchars[buf[i] & 0x0f];
        line_length += 2;
    }
    next()->writeString(out);
}

void
Pl_ASCIIHexEncoder::finish()
{
    if (!finished) {
        next()->writeString(">");
        finished = true;
    }
    next()->finish();
}
