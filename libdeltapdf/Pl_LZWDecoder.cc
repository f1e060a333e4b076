#include <deltapdf/Pl_LZWDecoder.hh>

#include <deltapdf/Util.hh>

#include <stdexcept>

using namespace deltapdf;

Pl_LZWDecoder::Pl_LZWDecoder(char const* identifier, Pipeline* next, bool early_change) :
    Pipeline(identifier, next),
    code_change_delta(early_change ? 1 : 0),
    single_char(1, '\0')
{
    util::assertion(next, "Attempt to create Pl_LZWDecoder with nullptr as next");
}

void
Pl_LZWDecoder::write(unsigned char const* bytes, size_t len)
{
    for (size_t i = 0; i < len && !eod; ++i) {
        bit_buffer = ((bit_buffer << 8) | bytes[i]) & 0xffffff;
        bits_available += 8;
        while (bits_available >= code_size && !eod) {
            bits_available -= code_size;
            unsigned int code = (bit_buffer >> bits_available) & ((1U << code_size) - 1);
            handleCode(code);
        }
    }
}

std::string const&
Pl_LZWDecoder::entry(unsigned int code)
{
    if (code < 256) {
        single_char[0] = static_cast<char>(code);
        return single_char;
    }
    if (code > 257 && (code - 258) < table.size()) {
        return table[code - 258];
    }
    throw std::runtime_error("LZWDecoder: bad code received");
}

void
Pl_LZWDecoder::handleCode(unsigned int code)
{
    if (code == 256) {
        table.clear();
        code_size = 9;
        have_last_code = false;
        return;
    }
    if (code == 257) {
        eod = true;
        return;
    }

    if (have_last_code) {
        // The new entry is the previous string plus the first character of the current one. If
        // the current code is the one being defined, its first character is the previous
        // string's first character.
        auto new_idx = static_cast<unsigned int>(258 + table.size());
        if (new_idx >= 4096) {
            throw std::runtime_error("LZWDecoder: table full");
        }
        std::string new_entry = entry(last_code);
        if (code < new_idx) {
            new_entry += entry(code)[0];
        } else if (code == new_idx) {
            new_entry += new_entry[0];
        } else {
            throw std::runtime_error("LZWDecoder: bad code received");
        }
        table.push_back(std::move(new_entry));

        unsigned int change_idx = new_idx + code_change_delta;
        if (change_idx == 511) {
            code_size = 10;
        } else if (change_idx == 1023) {
            code_size = 11;
        } else if (change_idx == 2047) {
            code_size = 12;
        }
    } else if (code > 257) {
        throw std::runtime_error("LZWDecoder: bad code received");
    }

    next()->writeString(entry(code));
    last_code = code;
    have_last_code = true;
}

void
Pl_LZWDecoder::finish()
{
    next()->finish();
}
