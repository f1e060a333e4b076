#include <deltapdf/Pl_PNGFilter.hh>

#include <algorithm>
#include <climits>
#include <cstring>
#include <stdexcept>

static int
abs_diff(int a, int b)
{
    return a > b ? a - b : b - a;
}

Pl_PNGFilter::Pl_PNGFilter(
    char const* identifier,
    Pipeline* next,
    action_e action,
    unsigned int columns,
    unsigned int samples_per_pixel,
    unsigned int bits_per_sample) :
    Pipeline(identifier, next),
    action(action)
{
    if (samples_per_pixel < 1) {
        throw std::runtime_error("PNGFilter created with invalid samples_per_pixel");
    }
    if (!((bits_per_sample == 1) || (bits_per_sample == 2) || (bits_per_sample == 4) ||
          (bits_per_sample == 8) || (bits_per_sample == 16))) {
        throw std::runtime_error(
            "PNGFilter created with invalid bits_per_sample not 1, 2, 4, 8, or 16");
    }
    bytes_per_pixel = ((bits_per_sample * samples_per_pixel) + 7) / 8;
    unsigned long long bpr =
        ((1ULL * columns * bits_per_sample * samples_per_pixel) + 7) / 8;
    if ((bpr == 0) || (bpr > (UINT_MAX - 1))) {
        throw std::runtime_error("PNGFilter created with invalid columns value");
    }
    bytes_per_row = static_cast<size_t>(bpr);
    cur_row.assign(bytes_per_row + 1, 0);
    prev_row.assign(bytes_per_row + 1, 0);

    // number of bytes per incoming row
    incoming = (action == a_encode ? bytes_per_row : bytes_per_row + 1);
}

void
Pl_PNGFilter::write(unsigned char const* data, size_t len)
{
    // When encoding, incoming rows have no filter byte; store them after slot 0.
    size_t base = (action == a_encode ? 1 : 0);
    while (len > 0) {
        size_t n = std::min(len, incoming - pos);
        memcpy(cur_row.data() + base + pos, data, n);
        pos += n;
        data += n;
        len -= n;
        if (pos == incoming) {
            processRow();
            cur_row.swap(prev_row);
            std::fill(cur_row.begin(), cur_row.end(), 0);
            pos = 0;
        }
    }
}

void
Pl_PNGFilter::processRow()
{
    if (action == a_encode) {
        encodeRow();
    } else {
        decodeRow();
    }
}

void
Pl_PNGFilter::decodeRow()
{
    unsigned char* buffer = cur_row.data() + 1;
    unsigned char const* above = prev_row.data() + 1;
    size_t bpp = bytes_per_pixel;

    switch (cur_row[0]) {
    case 0:
        break;

    case 1: // Sub
        for (size_t i = bpp; i < bytes_per_row; ++i) {
            buffer[i] = static_cast<unsigned char>(buffer[i] + buffer[i - bpp]);
        }
        break;

    case 2: // Up
        for (size_t i = 0; i < bytes_per_row; ++i) {
            buffer[i] = static_cast<unsigned char>(buffer[i] + above[i]);
        }
        break;

    case 3: // Average
        for (size_t i = 0; i < bytes_per_row; ++i) {
            int left = (i >= bpp) ? buffer[i - bpp] : 0;
            buffer[i] = static_cast<unsigned char>(buffer[i] + (left + above[i]) / 2);
        }
        break;

    case 4: // Paeth
        for (size_t i = 0; i < bytes_per_row; ++i) {
            int left = 0;
            int upper_left = 0;
            if (i >= bpp) {
                left = buffer[i - bpp];
                upper_left = above[i - bpp];
            }
            buffer[i] =
                static_cast<unsigned char>(buffer[i] + PaethPredictor(left, above[i], upper_left));
        }
        break;

    default:
        throw std::runtime_error(
            "PNGFilter: invalid filter type " + std::to_string(int(cur_row[0])));
    }

    next()->write(buffer, bytes_per_row);
}

int
Pl_PNGFilter::PaethPredictor(int a, int b, int c)
{
    int p = a + b - c;
    int pa = abs_diff(p, a);
    int pb = abs_diff(p, b);
    int pc = abs_diff(p, c);

    if (pa <= pb && pa <= pc) {
        return a;
    }
    if (pb <= pc) {
        return b;
    }
    return c;
}

void
Pl_PNGFilter::encodeRow()
{
    // Always the "up" filter. prev_row holds the previous raw row, or zeroes for the first row.
    std::vector<unsigned char> out(bytes_per_row + 1);
    out[0] = 2;
    for (size_t i = 1; i <= bytes_per_row; ++i) {
        out[i] = static_cast<unsigned char>(cur_row[i] - prev_row[i]);
    }
    next()->write(out.data(), out.size());
}

void
Pl_PNGFilter::finish()
{
    if (pos) {
        // write partial row
        processRow();
    }
    std::fill(prev_row.begin(), prev_row.end(), 0);
    std::fill(cur_row.begin(), cur_row.end(), 0);
    pos = 0;

    next()->finish();
}
