#ifndef PL_LZWDECODER_HH
#define PL_LZWDECODER_HH

#include <deltapdf/Pipeline.hh>

#include <string>
#include <vector>

// Decoder for /LZWDecode. Codes are 9 to 12 bits wide, most significant bit first. Code 256 clears
// the table and 257 ends the data. With early_change, the code width grows one code before the
// table requires it, which is the PDF default (/EarlyChange 1).
class Pl_LZWDecoder final: public Pipeline
{
  public:
    Pl_LZWDecoder(char const* identifier, Pipeline* next, bool early_change);
    ~Pl_LZWDecoder() final = default;
    void write(unsigned char const* buf, size_t len) final;
    void finish() final;

  private:
    void handleCode(unsigned int code);
    std::string const& entry(unsigned int code);

    unsigned int code_size{9};
    unsigned int bit_buffer{0};
    unsigned int bits_available{0};
    unsigned int code_change_delta;
    bool eod{false};
    bool have_last_code{false};
    unsigned int last_code{0};
    std::string single_char;
    std::vector<std::string> table;
};

#endif // PL_LZWDECODER_HH
