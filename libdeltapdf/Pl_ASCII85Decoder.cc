#include <deltapdf/Pl_ASCII85Decoder.hh>

#include <deltapdf/Util.hh>

#include <cstring>
#include <stdexcept>

using namespace deltapdf;

Pl_ASCII85Decoder::Pl_ASCII85Decoder(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next)
{
    util::assertion(next, "Attempt to create Pl_ASCII85Decoder with nullptr as next");
}

void
Pl_ASCII85Decoder::write(unsigned char const* buf, size_t len)
{
    for (size_t i = 0; i < len && eod < 2; ++i) {
        unsigned char ch = buf[i];
        if (eod == 1) {
            if (ch != '>') {
                throw std::runtime_error("broken end-of-data sequence in base 85 data");
            }
            flush();
            eod = 2;
            break;
        }
        if (saw_lt) {
            saw_lt = false;
            if (ch != '~') {
                throw std::runtime_error("character out of range during base 85 decode");
            }
            continue;
        }
        if (util::is_space(static_cast<char>(ch)) || ch == '\0') {
            continue;
        }
        ++seen;
        if (ch == '<' && seen == 1) {
            // Optional "<~" prefix as written by PostScript encoders
            saw_lt = true;
            continue;
        }
        switch (ch) {
        case '~':
            eod = 1;
            break;

        case 'z':
            if (pos != 0) {
                throw std::runtime_error("unexpected z during base 85 decode");
            } else {
                unsigned char zeroes[4];
                memset(zeroes, '\0', 4);
                next()->write(zeroes, 4);
            }
            break;

        default:
            if ((ch < 33) || (ch > 117)) {
                throw std::runtime_error("character out of range during base 85 decode");
            }
            inbuf[pos++] = ch;
            if (pos == 5) {
                flush();
            }
            break;
        }
    }
}

void
Pl_ASCII85Decoder::flush()
{
    if (pos == 0) {
        return;
    }
    if (pos == 1) {
        throw std::runtime_error("base 85 data ends with a single character group");
    }
    unsigned long long lval = 0;
    for (int i = 0; i < 5; ++i) {
        lval *= 85;
        lval += (inbuf[i] - 33U);
    }
    if (lval > 0xffffffffULL) {
        throw std::runtime_error("base 85 group out of range");
    }

    unsigned char outbuf[4];
    for (int i = 3; i >= 0; --i) {
        outbuf[i] = static_cast<unsigned char>(lval & 0xff);
        lval >>= 8;
    }

    next()->write(outbuf, pos - 1);

    pos = 0;
    memset(inbuf, 117, 5);
}

void
Pl_ASCII85Decoder::finish()
{
    if (eod == 1) {
        throw std::runtime_error("broken end-of-data sequence in base 85 data");
    }
    flush();
    next()->finish();
}
