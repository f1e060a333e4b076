#include <deltapdf/Pl_Flate.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/Util.hh>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

using namespace deltapdf;

int Pl_Flate::compression_level = Z_DEFAULT_COMPRESSION;

namespace
{
    char const*
    zlib_error(int status)
    {
        switch (status) {
        case Z_ERRNO:
            return "zlib system error";
        case Z_STREAM_ERROR:
            return "zlib stream error";
        case Z_DATA_ERROR:
            return "zlib data error";
        case Z_MEM_ERROR:
            return "zlib memory error";
        case Z_BUF_ERROR:
            return "zlib buffer error";
        case Z_VERSION_ERROR:
            return "zlib version error";
        default:
            return "zlib unknown error";
        }
    }
} // namespace

Pl_Flate::Members::Members(size_t out_bufsize, action_e action) :
    zs(std::make_unique<z_stream_s>()),
    outbuf(out_bufsize),
    action(action)
{
}

Pl_Flate::Members::~Members()
{
    if (started) {
        if (action == a_deflate) {
            deflateEnd(zs.get());
        } else {
            inflateEnd(zs.get());
        }
    }
}

Pl_Flate::Pl_Flate(
    char const* identifier, Pipeline* next, action_e action, unsigned int out_bufsize) :
    Pipeline(identifier, next),
    m(std::make_unique<Members>(out_bufsize, action))
{
    util::assertion(next, "Attempt to create Pl_Flate with nullptr as next");
    util::assertion(out_bufsize > 0, "Pl_Flate: output buffer size must not be 0");
}

// Must be explicit and not inline -- see DELTAPDF_DLL_CLASS in DLL.h
Pl_Flate::~Pl_Flate() = default;

void
Pl_Flate::setCompressionLevel(int level)
{
    compression_level = level;
}

int
Pl_Flate::getCompressionLevel()
{
    return compression_level;
}

void
Pl_Flate::start()
{
    int status = Z_OK;
    // deflateInit and inflateInit are macros that use old-style casts.
#if defined(__GNUC__) || defined(__clang__)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    if (m->action == a_deflate) {
        status = deflateInit(m->zs.get(), compression_level);
    } else {
        status = inflateInit(m->zs.get());
    }
#if defined(__GNUC__) || defined(__clang__)
# pragma GCC diagnostic pop
#endif
    check("init", status);
    m->started = true;
}

void
Pl_Flate::write(unsigned char const* data, size_t len)
{
    if (m->finished) {
        throw std::logic_error(identifier + ": Pl_Flate: write() called after finish()");
    }
    if (!m->started) {
        start();
    }
    // zlib counts input in unsigned ints.
    static size_t const max_chunk = 1U << 30;
    while (len > 0) {
        size_t chunk = std::min(len, max_chunk);
        m->received = true;
        // zlib doesn't modify its input but only declares next_in const in some builds.
        m->zs->next_in = const_cast<unsigned char*>(data);
        m->zs->avail_in = DIntC::to_uint(chunk);
        run(m->action == a_inflate ? Z_SYNC_FLUSH : Z_NO_FLUSH);
        data += chunk;
        len -= chunk;
    }
}

void
Pl_Flate::run(int flush)
{
    z_stream& zs = *m->zs;
    // Once inflate has seen the end of the zlib stream, trailing bytes are ignored.
    while (!(m->action == a_inflate && m->stream_end)) {
        zs.next_out = m->outbuf.data();
        zs.avail_out = DIntC::to_uint(m->outbuf.size());
        int status = (m->action == a_deflate) ? deflate(&zs, flush) : inflate(&zs, flush);
        if (m->action == a_inflate && status == Z_DATA_ERROR && zs.msg &&
            strcmp(zs.msg, "incorrect data check") == 0) {
            // A bad Adler-32 checksum is not fatal. Everything before it has been decoded.
            status = Z_STREAM_END;
        }
        drain();
        if (status == Z_STREAM_END) {
            m->stream_end = (m->action == a_inflate);
            return;
        }
        if (status == Z_BUF_ERROR) {
            // No progress possible: input is used up and all output is out. Data that stops
            // early is reported by finish().
            return;
        }
        check("data", status);
        if (flush != Z_FINISH && zs.avail_in == 0 && zs.avail_out > 0) {
            return;
        }
    }
}

void
Pl_Flate::drain()
{
    size_t ready = m->outbuf.size() - m->zs->avail_out;
    if (ready > 0) {
        next()->write(m->outbuf.data(), ready);
    }
}

void
Pl_Flate::end()
{
    int status = (m->action == a_deflate) ? deflateEnd(m->zs.get()) : inflateEnd(m->zs.get());
    m->started = false;
    check("end", status);
}

void
Pl_Flate::finish()
{
    if (!m->finished) {
        m->finished = true;
        try {
            // An empty deflate still produces a complete zlib stream. An inflate that never
            // received data produces nothing.
            if (m->action == a_deflate && !m->started) {
                start();
            }
            if (m->started) {
                m->zs->next_in = nullptr;
                m->zs->avail_in = 0;
                run(Z_FINISH);
                end();
            }
            if (m->action == a_inflate && m->received && !m->stream_end) {
                throw std::runtime_error(identifier + ": inflate: data truncated");
            }
        } catch (std::runtime_error&) {
            next()->finish();
            throw;
        }
    }
    next()->finish();
}

void
Pl_Flate::check(char const* step, int status)
{
    if (status == Z_OK) {
        return;
    }
    std::string msg = identifier + (m->action == a_deflate ? ": deflate: " : ": inflate: ") +
        step + ": " + (m->zs->msg ? m->zs->msg : zlib_error(status));
    throw std::runtime_error(msg);
}
