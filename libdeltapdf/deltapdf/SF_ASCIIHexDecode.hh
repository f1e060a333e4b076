#ifndef SF_ASCIIHEXDECODE_HH
#define SF_ASCIIHEXDECODE_HH

#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/Pl_ASCIIHexDecoder.hh>
#include <deltapdf/Pl_ASCIIHexEncoder.hh>

#include <memory>

class SF_ASCIIHexDecode final: public DPDFStreamFilter
{
  public:
    SF_ASCIIHexDecode() = default;
    ~SF_ASCIIHexDecode() final = default;

    Pipeline*
    getDecodePipeline(Pipeline* next) final
    {
        pipeline = std::make_shared<Pl_ASCIIHexDecoder>("asciiHex decode", next);
        return pipeline.get();
    }

    Pipeline*
    getEncodePipeline(Pipeline* next) final
    {
        encoder = std::make_shared<Pl_ASCIIHexEncoder>("asciiHex encode", next);
        return encoder.get();
    }

    static std::shared_ptr<DPDFStreamFilter>
    factory()
    {
        return std::make_shared<SF_ASCIIHexDecode>();
    }

  private:
    std::shared_ptr<Pipeline> pipeline;
    std::shared_ptr<Pipeline> encoder;
};

#endif // SF_ASCIIHEXDECODE_HH
