#include <deltapdf/Pl_RunLength.hh>

#include <stdexcept>

namespace
{
    unsigned int constexpr max_run = 128;
} // namespace

Pl_RunLength::Pl_RunLength(char const* identifier, Pipeline* next, action_e action) :
    Pipeline(identifier, next),
    action(action)
{
}

Pl_RunLength::~Pl_RunLength() = default;

void
Pl_RunLength::write(unsigned char const* data, size_t len)
{
    if (action == a_encode) {
        encode(data, len);
    } else {
        decode(data, len);
    }
}

void
Pl_RunLength::encode(unsigned char const* data, size_t len)
{
    // In st_copying, buf holds literal bytes not yet written. In st_run, buf holds one byte and
    // length counts its repetitions.
    for (size_t i = 0; i < len; ++i) {
        auto ch = static_cast<char>(data[i]);
        if (state == st_run) {
            if (ch == buf[0] && length < max_run) {
                ++length;
                continue;
            }
            flush_encode();
        }
        if (state == st_copying && !buf.empty() && buf.back() == ch) {
            // Two equal bytes start a run; move the last literal into it.
            buf.pop_back();
            flush_encode();
            buf.assign(1, ch);
            length = 2;
            state = st_run;
            continue;
        }
        if (buf.size() == max_run) {
            flush_encode();
        }
        buf += ch;
        state = st_copying;
    }
}

void
Pl_RunLength::decode(unsigned char const* data, size_t len)
{
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = data[i];
        switch (state) {
        case st_top:
            if (ch < 128) {
                // length represents remaining number of bytes to copy
                length = 1U + ch;
                state = st_copying;
            } else if (ch > 128) {
                // length represents number of copies of next byte
                length = 257U - ch;
                state = st_run;
            } else {
                state = st_eod;
            }
            break;

        case st_copying:
            next()->write(&ch, 1);
            if (--length == 0) {
                state = st_top;
            }
            break;

        case st_run:
            buf.assign(length, static_cast<char>(ch));
            next()->writeString(buf);
            buf.clear();
            state = st_top;
            break;

        case st_eod:
            // Anything after the end-of-data marker is ignored.
            return;
        }
    }
}

void
Pl_RunLength::flush_encode()
{
    if (state == st_run) {
        if (length < 2 || length > max_run) {
            throw std::logic_error("Pl_RunLength: invalid length in flush_encode for run");
        }
        auto ch = static_cast<unsigned char>(257 - length);
        next()->write(&ch, 1);
        next()->writeString(buf.substr(0, 1));
    } else if (!buf.empty()) {
        auto ch = static_cast<unsigned char>(buf.size() - 1);
        next()->write(&ch, 1);
        next()->writeString(buf);
    }
    buf.clear();
    length = 0;
    state = st_top;
}

void
Pl_RunLength::finish()
{
    // A decoder that stops in the middle of a run or literal block writes what it has. The data
    // was cut short, but what was decoded is still correct.
    if (action == a_encode) {
        flush_encode();
        unsigned char ch = 128;
        next()->write(&ch, 1);
    }
    next()->finish();
}
