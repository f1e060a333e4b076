#ifndef PL_ASCIIHEXENCODER_HH
#define PL_ASCIIHEXENCODER_HH

#include <deltapdf/Pipeline.hh>

// Writes lower-case hexadecimal, 64 digits per line, terminated by '>'.
class Pl_ASCIIHexEncoder final: public Pipeline
{
  public:
    Pl_ASCIIHexEncoder(char const* identifier, Pipeline* next);
    ~Pl_ASCIIHexEncoder() final = default;
    void write(unsigned char const* buf, size_t len) final;
    void finish() final;

  private:
    size_t line_length{0};
    bool finished{false};
};

#endif // PL_ASCIIHEXENCODER_HH
