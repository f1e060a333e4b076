#ifndef PL_PNGFILTER_HH
#define PL_PNGFILTER_HH

#include <deltapdf/Pipeline.hh>

#include <vector>

// This pipeline applies or reverses the PNG row filters used by /Predictor values 10 to 15. Each
// encoded row is prefixed by a filter type byte. Decoding handles all five filter types; encoding
// always uses the "up" filter.
class Pl_PNGFilter final: public Pipeline
{
  public:
    enum action_e { a_encode, a_decode };

    Pl_PNGFilter(
        char const* identifier,
        Pipeline* next,
        action_e action,
        unsigned int columns,
        unsigned int samples_per_pixel = 1,
        unsigned int bits_per_sample = 8);
    ~Pl_PNGFilter() final = default;

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

  private:
    void processRow();
    void encodeRow();
    void decodeRow();
    static int PaethPredictor(int a, int b, int c);

    action_e action;
    size_t bytes_per_row;
    size_t bytes_per_pixel;
    // Rows include the leading filter byte in both actions so that indexing is the same.
    std::vector<unsigned char> cur_row;
    std::vector<unsigned char> prev_row;
    size_t pos{0};
    size_t incoming;
};

#endif // PL_PNGFILTER_HH
