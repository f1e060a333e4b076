#include <deltapdf/Pl_TIFFPredictor.hh>

#include <algorithm>
#include <climits>
#include <stdexcept>

namespace
{
    // Read or write 'bits' bits at bit offset 'pos', most significant bit first.
    unsigned int
    get_bits(std::vector<unsigned char> const& row, size_t pos, unsigned int bits)
    {
        unsigned int result = 0;
        for (unsigned int i = 0; i < bits; ++i, ++pos) {
            unsigned int bit = (row[pos / 8] >> (7 - (pos % 8))) & 1U;
            result = (result << 1) | bit;
        }
        return result;
    }

    void
    put_bits(std::vector<unsigned char>& row, size_t pos, unsigned int bits, unsigned int value)
    {
        for (unsigned int i = 0; i < bits; ++i, ++pos) {
            unsigned int bit = (value >> (bits - 1 - i)) & 1U;
            auto mask = static_cast<unsigned char>(1U << (7 - (pos % 8)));
            if (bit) {
                row[pos / 8] |= mask;
            } else {
                row[pos / 8] &= static_cast<unsigned char>(~mask);
            }
        }
    }
} // namespace

Pl_TIFFPredictor::Pl_TIFFPredictor(
    char const* identifier,
    Pipeline* next,
    action_e action,
    unsigned int columns,
    unsigned int samples_per_pixel,
    unsigned int bits_per_sample) :
    Pipeline(identifier, next),
    action(action),
    columns(columns),
    samples_per_pixel(samples_per_pixel),
    bits_per_sample(bits_per_sample)
{
    if (samples_per_pixel < 1) {
        throw std::runtime_error("TIFFPredictor created with invalid samples_per_pixel");
    }
    if ((bits_per_sample < 1) || (bits_per_sample > 16)) {
        throw std::runtime_error("TIFFPredictor created with invalid bits_per_sample");
    }
    unsigned long long bpr = ((1ULL * columns * bits_per_sample * samples_per_pixel) + 7) / 8;
    if ((bpr == 0) || (bpr > (UINT_MAX - 1))) {
        throw std::runtime_error("TIFFPredictor created with invalid columns value");
    }
    bytes_per_row = static_cast<size_t>(bpr);
    cur_row.reserve(bytes_per_row);
}

void
Pl_TIFFPredictor::write(unsigned char const* data, size_t len)
{
    while (len > 0) {
        size_t n = std::min(len, bytes_per_row - cur_row.size());
        cur_row.insert(cur_row.end(), data, data + n);
        data += n;
        len -= n;
        if (cur_row.size() == bytes_per_row) {
            processRow();
            cur_row.clear();
        }
    }
}

void
Pl_TIFFPredictor::processRow()
{
    unsigned int mask = (1U << bits_per_sample) - 1;
    out.assign(bytes_per_row, 0);
    previous.assign(samples_per_pixel, 0);
    size_t pos = 0;
    for (unsigned int col = 0; col < columns; ++col) {
        for (auto& prev: previous) {
            unsigned int sample = get_bits(cur_row, pos, bits_per_sample);
            unsigned int new_sample = 0;
            if (action == a_encode) {
                new_sample = (sample - prev) & mask;
                prev = sample;
            } else {
                new_sample = (sample + prev) & mask;
                prev = new_sample;
            }
            put_bits(out, pos, bits_per_sample, new_sample);
            pos += bits_per_sample;
        }
    }
    // Padding bits at the end of the row are passed through.
    for (; pos < 8 * bytes_per_row; ++pos) {
        put_bits(out, pos, 1, get_bits(cur_row, pos, 1));
    }
    next()->write(out.data(), out.size());
}

void
Pl_TIFFPredictor::finish()
{
    if (!cur_row.empty()) {
        // write partial row
        cur_row.insert(cur_row.end(), bytes_per_row - cur_row.size(), 0);
        processRow();
    }
    cur_row.clear();
    next()->finish();
}
