#ifndef PL_TIFFPREDICTOR_HH
#define PL_TIFFPREDICTOR_HH

// This pipeline applies or reverses TIFF predictor 2 (horizontal differencing, /Predictor 2).
// Samples may be 1 to 16 bits wide and are packed most significant bit first within each row.

#include <deltapdf/Pipeline.hh>

#include <vector>

class Pl_TIFFPredictor final: public Pipeline
{
  public:
    enum action_e { a_encode, a_decode };

    Pl_TIFFPredictor(
        char const* identifier,
        Pipeline* next,
        action_e action,
        unsigned int columns,
        unsigned int samples_per_pixel = 1,
        unsigned int bits_per_sample = 8);
    ~Pl_TIFFPredictor() final = default;

    void write(unsigned char const* data, size_t len) final;
    void finish() final;

  private:
    void processRow();

    action_e action;
    unsigned int columns;
    size_t bytes_per_row;
    unsigned int samples_per_pixel;
    unsigned int bits_per_sample;
    std::vector<unsigned char> cur_row;
    std::vector<unsigned int> previous;
    std::vector<unsigned char> out;
};

#endif // PL_TIFFPREDICTOR_HH
