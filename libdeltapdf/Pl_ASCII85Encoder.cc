#include <deltapdf/Pl_ASCII85Encoder.hh>

#include <deltapdf/Util.hh>

#include <stdexcept>

using namespace deltapdf;

namespace
{
    size_t constexpr max_line_length = 72;
} // namespace

Pl_ASCII85Encoder::Pl_ASCII85Encoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    util::assertion(next, "Attempt to create Pl_ASCII85Encoder with nullptr as next");
}

void
Pl_ASCII85Encoder::write(unsigned char const* buf, size_t len)
{
    if (finished) {
        throw std::logic_error(identifier + ": write() called after finish()");
    }
    for (size_t i = 0; i < len; ++i) {
        inbuf[pos++] = buf[i];
        if (pos == 4) {
            flush();
        }
    }
}

void
Pl_ASCII85Encoder::emit(char const* data, size_t len)
{
    for (size_t i = 0; i < len; ++i) {
        if (line_length == max_line_length) {
            next()->writeString("\n");
            line_length = 0;
        }
        next()->write(data + i, 1);
        ++line_length;
    }
}

void
Pl_ASCII85Encoder::flush()
{
    if (pos == 0) {
        return;
    }
    unsigned long lval = 0;
    for (size_t i = 0; i < 4; ++i) {
        lval <<= 8;
        lval |= (i < pos ? inbuf[i] : 0U);
    }
    if (lval == 0 && pos == 4) {
        emit("z", 1);
    } else {
        char out[5];
        for (int i = 4; i >= 0; --i) {
            out[i] = static_cast<char>('!' + (lval % 85));
            lval /= 85;
        }
        // A partial group of n bytes is written as n + 1 characters.
        emit(out, pos + 1);
    }
    pos = 0;
    inbuf[0] = inbuf[1] = inbuf[2] = inbuf[3] = 0;
}

void
Pl_ASCII85Encoder::finish()
{
    if (!finished) {
        flush();
        next()->writeString("~>");
        finished = true;
    }
    next()->finish();
}
