#include <deltapdf/SF_FlateLzwDecode.hh>

#include <deltapdf/DIntC.hh>
#include <deltapdf/Pl_Flate.hh>
#include <deltapdf/Pl_LZWDecoder.hh>
#include <deltapdf/Pl_PNGFilter.hh>
#include <deltapdf/Pl_TIFFPredictor.hh>

namespace
{
    // Leaves value alone when the key is absent. Returns false for a value that isn't an integer.
    bool
    read_int(DPDFObjectHandle const& parms, std::string const& key, int& value)
    {
        auto item = parms.getKey(key);
        if (item.isNull()) {
            return true;
        }
        if (!item.isInteger()) {
            return false;
        }
        value = item.getIntValueAsInt();
        return true;
    }
} // namespace

bool
SF_FlateLzwDecode::setDecodeParms(DPDFObjectHandle decode_parms)
{
    if (decode_parms.isNull()) {
        return true;
    }
    if (!decode_parms.isDictionary()) {
        return false;
    }
    // Other keys don't affect decoding and are ignored.
    if (!(read_int(decode_parms, "/Predictor", predictor) &&
          read_int(decode_parms, "/Columns", columns) &&
          read_int(decode_parms, "/Colors", colors) &&
          read_int(decode_parms, "/BitsPerComponent", bits_per_component))) {
        return false;
    }
    if (lzw && !(read_int(decode_parms, "/EarlyChange", early_change) &&
                 (early_change == 0 || early_change == 1))) {
        return false;
    }
    if (predictor == 1) {
        return true;
    }
    if (predictor != 2 && (predictor < 10 || predictor > 15)) {
        return false;
    }
    switch (bits_per_component) {
    case 1:
    case 2:
    case 4:
    case 8:
    case 16:
        return columns > 0 && colors > 0;
    default:
        return false;
    }
}

Pipeline*
SF_FlateLzwDecode::keep(std::unique_ptr<Pipeline> pipeline)
{
    pipelines.push_back(std::move(pipeline));
    return pipelines.back().get();
}

Pipeline*
SF_FlateLzwDecode::getDecodePipeline(Pipeline* next)
{
    // The predictor is undone on the decompressed data, so it sits after the decoder.
    auto cols = DIntC::to_uint(columns);
    auto samples = DIntC::to_uint(colors);
    auto bits = DIntC::to_uint(bits_per_component);
    if (predictor == 2) {
        next = keep(std::make_unique<Pl_TIFFPredictor>(
            "tiff decode", next, Pl_TIFFPredictor::a_decode, cols, samples, bits));
    } else if (predictor >= 10) {
        next = keep(std::make_unique<Pl_PNGFilter>(
            "png decode", next, Pl_PNGFilter::a_decode, cols, samples, bits));
    }
    if (lzw) {
        return keep(std::make_unique<Pl_LZWDecoder>("lzw decode", next, early_change == 1));
    }
    return keep(std::make_unique<Pl_Flate>("stream inflate", next, Pl_Flate::a_inflate));
}

Pipeline*
SF_FlateLzwDecode::getEncodePipeline(Pipeline* next)
{
    if (lzw) {
        return nullptr;
    }
    return keep(std::make_unique<Pl_Flate>("stream deflate", next, Pl_Flate::a_deflate));
}
