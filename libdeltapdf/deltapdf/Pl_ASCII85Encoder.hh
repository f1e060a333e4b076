#ifndef PL_ASCII85ENCODER_HH
#define PL_ASCII85ENCODER_HH

#include <deltapdf/Pipeline.hh>

// Writes base 85 data in the form /ASCII85Decode expects: groups of five characters, 'z' for an
// all-zero group, lines of at most 72 characters, and a closing "~>" without a leading "<~".
class Pl_ASCII85Encoder final: public Pipeline
{
  public:
    Pl_ASCII85Encoder(char const* identifier, Pipeline* next);
    ~Pl_ASCII85Encoder() final = default;
    void write(unsigned char const* buf, size_t len) final;
    void finish() final;

  private:
    void flush();
    void emit(char const* data, size_t len);

    unsigned char inbuf[4]{0, 0, 0, 0};
    size_t pos{0};
    size_t line_length{0};
    bool finished{false};
};

#endif // PL_ASCII85ENCODER_HH
