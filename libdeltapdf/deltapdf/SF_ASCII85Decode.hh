#ifndef SF_ASCII85DECODE_HH
#define SF_ASCII85DECODE_HH

#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/Pl_ASCII85Decoder.hh>
#include <deltapdf/Pl_ASCII85Encoder.hh>

#include <memory>

class SF_ASCII85Decode final: public DPDFStreamFilter
{
  public:
    SF_ASCII85Decode() = default;
    ~SF_ASCII85Decode() final = default;

    Pipeline*
    getDecodePipeline(Pipeline* next) final
    {
        pipeline = std::make_shared<Pl_ASCII85Decoder>("ascii85 decode", next);
        return pipeline.get();
    }

    Pipeline*
    getEncodePipeline(Pipeline* next) final
    {
        encoder = std::make_shared<Pl_ASCII85Encoder>("ascii85 encode", next);
        return encoder.get();
    }

    static std::shared_ptr<DPDFStreamFilter>
    factory()
    {
        return std::make_shared<SF_ASCII85Decode>();
    }

  private:
    std::shared_ptr<Pipeline> pipeline;
    std::shared_ptr<Pipeline> encoder;
};

#endif // SF_ASCII85DECODE_HH
