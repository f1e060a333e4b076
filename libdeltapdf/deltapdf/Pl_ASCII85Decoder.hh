#ifndef PL_ASCII85DECODER_HH
#define PL_ASCII85DECODER_HH

#include <deltapdf/Pipeline.hh>

class Pl_ASCII85Decoder final: public Pipeline
{
  public:
    Pl_ASCII85Decoder(char const* identifier, Pipeline* next);
    ~Pl_ASCII85Decoder() final = default;
    void write(unsigned char const* buf, size_t len) final;
    void finish() final;

  private:
    void flush();

    unsigned char inbuf[5]{117, 117, 117, 117, 117};
    size_t pos{0};
    // 0: data; 1: saw '~'; 2: done
    int eod{0};
    // Number of characters seen, used to skip an optional leading "<~"
    size_t seen{0};
    bool saw_lt{false};
};

#endif // PL_ASCII85DECODER_HH
