#include <deltapdf/assert_test.h>

// This program tests the stream filters through DPDFStreamFilter::decode and
// DPDFStreamFilter::encode.

#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/Pl_Flate.hh>
#include <deltapdf/Pl_PNGFilter.hh>
#include <deltapdf/Pl_String.hh>
#include <deltapdf/Pl_TIFFPredictor.hh>

#include <cstdint>
#include <iostream>
#include <map>
#include <stdexcept>
#include <vector>

static DPDFObjectHandle
name(char const* n)
{
    return DPDFObjectHandle::newName(n);
}

static DPDFObjectHandle
parms(std::string const& str)
{
    return DPDFObjectHandle::parse(str);
}

static void
run(Pipeline& p, std::string const& data)
{
    p.writeString(data);
    p.finish();
}

static std::string
encode(std::string const& data, char const* filter)
{
    return DPDFStreamFilter::encode(data, DPDFObjectHandle::parse(filter), "test stream");
}

static std::string
flate_encode(std::string const& data)
{
    return encode(data, "/FlateDecode");
}

static std::string
a85_encode(std::string const& data)
{
    return encode(data, "/ASCII85Decode");
}

static std::string
ahx_encode(std::string const& data)
{
    return encode(data, "/ASCIIHexDecode");
}

static std::string
rl_encode(std::string const& data)
{
    return encode(data, "/RunLengthDecode");
}

// LZW writer matching the decoder's code width schedule. The decoder adds no table entry for the
// first code after a clear, so the width of the n-th code since a clear depends on the entry the
// decoder added while reading code n - 1.
static std::string
lzw_encode(std::string const& data, int early_change, int& clears)
{
    std::string out;
    unsigned long long buffer = 0;
    int nbits = 0;
    int count = 0;
    auto emit = [&](unsigned int code) {
        ++count;
        int idx = 255 + count + early_change;
        int width = idx >= 2047 ? 12 : idx >= 1023 ? 11 : idx >= 511 ? 10 : 9;
        assert(code < (1U << width));
        buffer = (buffer << width) | code;
        nbits += width;
        while (nbits >= 8) {
            nbits -= 8;
            out += static_cast<char>((buffer >> nbits) & 0xff);
        }
    };

    std::map<std::string, unsigned int> table;
    unsigned int next_code = 258;
    auto reset = [&]() {
        table.clear();
        for (unsigned int i = 0; i < 256; ++i) {
            table[std::string(1, static_cast<char>(i))] = i;
        }
        next_code = 258;
    };
    reset();
    clears = 0;

    std::string w;
    for (char c: data) {
        std::string wc = w + c;
        if (table.count(wc)) {
            w = wc;
            continue;
        }
        emit(table[w]);
        if (next_code < 4000) {
            table[wc] = next_code++;
        } else {
            emit(256);
            ++clears;
            count = 0;
            reset();
        }
        w = std::string(1, c);
    }
    if (!w.empty()) {
        emit(table[w]);
    }
    emit(257);
    if (nbits > 0) {
        out += static_cast<char>((buffer << (8 - nbits)) & 0xff);
    }
    return out;
}

static std::string
decode(std::string const& raw, DPDFObjectHandle filter, DPDFObjectHandle decode_parms = {})
{
    return DPDFStreamFilter::decode(raw, filter, decode_parms, "test stream");
}

static void
expect_error(
    std::string const& raw,
    DPDFObjectHandle filter,
    DPDFObjectHandle decode_parms,
    dpdf_error_code_e code)
{
    try {
        decode(raw, filter, decode_parms);
        assert(false);
    } catch (DPDFExc& e) {
        std::cout << "expected error: " << e.what() << '\n';
        assert(e.getErrorCode() == code);
        assert(e.getFilename() == "test stream");
    }
}

static void
test_round_trips()
{
    std::vector<std::string> samples = {
        "",
        "x",
        "Hello, world!",
        std::string(1000, 'a'),
        std::string("\0\0\0\0\0\0\0\0zz\0\0\0\0", 14),
        std::string("\xff\xfe\x00\x01\x80\x7f", 6),
    };
    std::string all_bytes;
    for (int i = 0; i < 256; ++i) {
        all_bytes += static_cast<char>(i);
    }
    samples.push_back(all_bytes + all_bytes);

    for (auto const& data: samples) {
        assert(decode(flate_encode(data), name("/FlateDecode")) == data);
        assert(decode(a85_encode(data), name("/ASCII85Decode")) == data);
        assert(decode(ahx_encode(data), name("/ASCIIHexDecode")) == data);
        assert(decode(rl_encode(data), name("/RunLengthDecode")) == data);
        // Abbreviated names
        assert(decode(flate_encode(data), name("/Fl")) == data);
        assert(decode(ahx_encode(data), name("/AHx")) == data);
        assert(encode(data, "/Fl") == flate_encode(data));
        assert(encode(data, "/A85") == a85_encode(data));
    }
    assert(ahx_encode("\x01\xab") == "01ab>");
    assert(encode("raw", "null") == "raw");
    assert(encode("raw", "[]") == "raw");

    // No filter returns the data unchanged
    assert(decode("raw", DPDFObjectHandle::newNull()) == "raw");
    assert(decode("raw", DPDFObjectHandle::newArray()) == "raw");
}

static void
test_filter_chain()
{
    std::string data = "chained filters apply in order";
    auto raw = ahx_encode(flate_encode(data));
    auto filters = DPDFObjectHandle::parse("[ /ASCIIHexDecode /FlateDecode ]");
    assert(decode(raw, filters) == data);
    assert(decode(raw, filters, parms("[ null null ]")) == data);

    // The last filter in the array is applied first when encoding
    assert(encode(data, "[ /ASCIIHexDecode /FlateDecode ]") == raw);
    assert(decode(encode(data, "[ /ASCIIHexDecode /FlateDecode ]"), filters) == data);

    auto raw2 = a85_encode(rl_encode(data));
    assert(encode(data, "[ /A85 /RL ]") == raw2);
    assert(decode(raw2, parms("[ /A85 /RL ]")) == data);
}

static void
test_ascii_decoders()
{
    assert(decode("<~87cURD]i,\"Ebo7~>", name("/ASCII85Decode")) == "Hello World");
    // z stands for four zero bytes and whitespace is ignored
    assert(decode("z\n z~>", name("/ASCII85Decode")) == std::string(8, '\0'));
    assert(decode("48 65\n6c6C 6>", name("/ASCIIHexDecode")) == "Hell`");
    assert(decode("414>ignored", name("/ASCIIHexDecode")) == "A@");
}

static void
test_lzw()
{
    // Example from the PDF specification: "-----A---B" with early change
    std::string raw("\x80\x0b\x60\x50\x22\x0c\x0c\x85\x01", 9);
    assert(decode(raw, name("/LZWDecode")) == "-----A---B");
    assert(decode(raw, name("/LZWDecode"), parms("<< /EarlyChange 1 >>")) == "-----A---B");
    expect_error(raw, name("/LZWDecode"), parms("<< /EarlyChange 2 >>"), dpdf_e_unsupported);

    // Enough distinct strings to grow through 10, 11, and 12 bit codes and fill the table
    std::string data;
    std::uint32_t seed = 12345;
    for (int i = 0; i < 20000; ++i) {
        seed = seed * 1103515245U + 12345U;
        data += static_cast<char>('a' + ((seed >> 16) & 15));
    }
    int clears = 0;
    auto late = lzw_encode(data, 0, clears);
    assert(clears == 2);
    assert(late.size() > 12000);
    assert(decode(late, name("/LZWDecode"), parms("<< /EarlyChange 0 >>")) == data);
    auto early = lzw_encode(data, 1, clears);
    assert(clears == 2);
    assert(decode(early, name("/LZWDecode")) == data);
    assert(decode(early, name("/LZWDecode"), parms("<< /EarlyChange 1 >>")) == data);
    // Reading with the wrong schedule misaligns the codes
    expect_error(late, name("/LZWDecode"), {}, dpdf_e_corrupted);
    expect_error(early, name("/LZWDecode"), parms("<< /EarlyChange 0 >>"), dpdf_e_corrupted);
}

static void
test_compression_level()
{
    assert(Pl_Flate::getCompressionLevel() == -1);
    std::string data;
    for (int i = 0; i < 4000; ++i) {
        data += std::to_string(i % 97) + " 0 obj ";
    }
    Pl_Flate::setCompressionLevel(1);
    assert(Pl_Flate::getCompressionLevel() == 1);
    auto fast = flate_encode(data);
    Pl_Flate::setCompressionLevel(9);
    auto best = flate_encode(data);
    Pl_Flate::setCompressionLevel(-1);
    assert(best.size() < fast.size());
    assert(decode(fast, name("/FlateDecode")) == data);
    assert(decode(best, name("/FlateDecode")) == data);
}

static void
test_predictors()
{
    // Four rows of four bytes
    std::string image;
    for (int i = 0; i < 16; ++i) {
        image += static_cast<char>(i * 7 + 3);
    }

    std::string png;
    {
        Pl_String s("png", nullptr, png);
        Pl_PNGFilter f("png encode", &s, Pl_PNGFilter::a_encode, 4);
        run(f, image);
    }
    assert(png.size() == 20);
    assert(
        decode(flate_encode(png), name("/FlateDecode"), parms("<< /Predictor 12 /Columns 4 >>")) ==
        image);
    // Predictor values 10 through 15 all mean the row tags say what to do
    assert(
        decode(flate_encode(png), name("/FlateDecode"), parms("<< /Predictor 15 /Columns 4 >>")) ==
        image);

    // Sub filter on a hand-made row: 1 2 3 4 stored as differences
    std::string sub("\x01\x01\x01\x01\x01", 5);
    assert(
        decode(flate_encode(sub), name("/FlateDecode"), parms("<< /Predictor 11 /Columns 4 >>")) ==
        "\x01\x02\x03\x04");

    // Two RGB pixels per row
    std::string tiff;
    {
        Pl_String s("tiff", nullptr, tiff);
        Pl_TIFFPredictor t("tiff encode", &s, Pl_TIFFPredictor::a_encode, 2, 3, 8);
        run(t, image.substr(0, 12));
    }
    assert(tiff.size() == 12);
    assert(
        decode(
            flate_encode(tiff),
            name("/FlateDecode"),
            parms("<< /Predictor 2 /Columns 2 /Colors 3 /BitsPerComponent 8 >>")) ==
        image.substr(0, 12));

    expect_error(
        flate_encode(png), name("/FlateDecode"), parms("<< /Predictor 5 >>"), dpdf_e_unsupported);
    expect_error(
        flate_encode(png),
        name("/FlateDecode"),
        parms("<< /Predictor 12 /Columns 0 >>"),
        dpdf_e_unsupported);
    expect_error(
        flate_encode(png),
        name("/FlateDecode"),
        parms("<< /Predictor 12 /Columns 4 /BitsPerComponent 3 >>"),
        dpdf_e_unsupported);
    // Bad PNG row tag
    expect_error(
        flate_encode(std::string("\x09\x00\x00\x00\x00", 5)),
        name("/FlateDecode"),
        parms("<< /Predictor 12 /Columns 4 >>"),
        dpdf_e_corrupted);
}

static void
test_errors()
{
    expect_error("data", name("/DCTDecode"), {}, dpdf_e_unsupported);
    expect_error("data", parms("[ /FlateDecode /JBIG2Decode ]"), {}, dpdf_e_unsupported);
    expect_error("data", DPDFObjectHandle::newInteger(3), {}, dpdf_e_invalid_object);
    expect_error("data", parms("[ /FlateDecode 3 ]"), {}, dpdf_e_invalid_object);
    expect_error(
        ahx_encode("x"), name("/ASCIIHexDecode"), parms("[ null null ]"), dpdf_e_invalid_object);
    expect_error("not zlib data", name("/FlateDecode"), {}, dpdf_e_corrupted);
    // Truncated zlib data
    auto truncated = flate_encode(std::string(100, 'q'));
    truncated.resize(truncated.size() / 2);
    expect_error(truncated, name("/FlateDecode"), {}, dpdf_e_corrupted);
    expect_error("4G>", name("/ASCIIHexDecode"), {}, dpdf_e_corrupted);
    expect_error("ab~c", name("/ASCII85Decode"), {}, dpdf_e_corrupted);
    expect_error(std::string("\xff\xff\xff", 3), name("/LZWDecode"), {}, dpdf_e_corrupted);
    // Filters that take no parameters reject unknown ones
    expect_error("41>", name("/ASCIIHexDecode"), parms("<< /Columns 4 >>"), dpdf_e_unsupported);

    for (auto filter: {"/LZWDecode", "/DCTDecode", "[ /FlateDecode /LZW ]"}) {
        try {
            encode("data", filter);
            assert(false);
        } catch (DPDFExc& e) {
            std::cout << "expected error: " << e.what() << '\n';
            assert(e.getErrorCode() == dpdf_e_unsupported);
        }
    }
    try {
        encode("data", "3");
        assert(false);
    } catch (DPDFExc& e) {
        assert(e.getErrorCode() == dpdf_e_invalid_object);
    }

    try {
        decode("data", DPDFObjectHandle::newReference(5, 0));
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << '\n';
    }
}

int
main()
{
    test_round_trips();
    test_filter_chain();
    test_ascii_decoders();
    test_lzw();
    test_compression_level();
    test_predictors();
    test_errors();
    std::cout << "filter tests done" << '\n';
    return 0;
}
