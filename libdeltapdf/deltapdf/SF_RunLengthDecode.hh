#ifndef SF_RUNLENGTHDECODE_HH
#define SF_RUNLENGTHDECODE_HH

#include <deltapdf/DPDFStreamFilter.hh>
#include <deltapdf/Pl_RunLength.hh>

#include <memory>

class SF_RunLengthDecode final: public DPDFStreamFilter
{
  public:
    SF_RunLengthDecode() = default;
    ~SF_RunLengthDecode() final = default;

    Pipeline*
    getDecodePipeline(Pipeline* next) final
    {
        pipeline =
            std::make_shared<Pl_RunLength>("runlength decode", next, Pl_RunLength::a_decode);
        return pipeline.get();
    }

    Pipeline*
    getEncodePipeline(Pipeline* next) final
    {
        encoder =
            std::make_shared<Pl_RunLength>("runlength encode", next, Pl_RunLength::a_encode);
        return encoder.get();
    }

    static std::shared_ptr<DPDFStreamFilter>
    factory()
    {
        return std::make_shared<SF_RunLengthDecode>();
    }

  private:
    std::shared_ptr<Pipeline> pipeline;
    std::shared_ptr<Pipeline> encoder;
};

#endif // SF_RUNLENGTHDECODE_HH
