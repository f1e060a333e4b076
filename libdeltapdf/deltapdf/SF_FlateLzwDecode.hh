#ifndef SF_FLATELZWDECODE_HH
#define SF_FLATELZWDECODE_HH

#include <deltapdf/DPDFStreamFilter.hh>

#include <memory>
#include <vector>

// /FlateDecode and /LZWDecode share their decode parameters: an optional TIFF or PNG predictor
// described by /Predictor, /Columns, /Colors and /BitsPerComponent, plus /EarlyChange for LZW.
class SF_FlateLzwDecode final: public DPDFStreamFilter
{
  public:
    SF_FlateLzwDecode(bool lzw) :
        lzw(lzw)
    {
    }
    ~SF_FlateLzwDecode() final = default;

    bool setDecodeParms(DPDFObjectHandle decode_parms) final;
    Pipeline* getDecodePipeline(Pipeline* next) final;
    // Flate only. New data is never LZW-encoded.
    Pipeline* getEncodePipeline(Pipeline* next) final;

    static std::shared_ptr<DPDFStreamFilter>
    flate_factory()
    {
        return std::make_shared<SF_FlateLzwDecode>(false);
    }
    static std::shared_ptr<DPDFStreamFilter>
    lzw_factory()
    {
        return std::make_shared<SF_FlateLzwDecode>(true);
    }

  private:
    Pipeline* keep(std::unique_ptr<Pipeline> pipeline);

    bool lzw{};
    int predictor{1};
    int columns{1};
    int colors{1};
    int bits_per_component{8};
    int early_change{1};
    std::vector<std::unique_ptr<Pipeline>> pipelines;
};

#endif // SF_FLATELZWDECODE_HH
