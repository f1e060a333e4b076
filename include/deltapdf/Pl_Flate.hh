// Copyright (c) 2024-2026 The deltapdf authors
//
// This file is part of deltapdf.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.


#ifndef PL_FLATE_HH
#define PL_FLATE_HH

#include <deltapdf/Pipeline.hh>

#include <memory>
#include <string>
#include <vector>

struct z_stream_s;

// zlib pipeline. Inflate decodes /FlateDecode data; deflate compresses data for new streams.
// zlib errors are thrown as std::runtime_error.
class DELTAPDF_DLL_CLASS Pl_Flate: public Pipeline
{
  public:
    static unsigned int const def_bufsize = 65536;

    enum action_e { a_inflate, a_deflate };

    DELTAPDF_DLL
    Pl_Flate(
        char const* identifier,
        Pipeline* next,
        action_e action,
        unsigned int out_bufsize = def_bufsize);
    DELTAPDF_DLL
    ~Pl_Flate() override;

    DELTAPDF_DLL
    void write(unsigned char const* data, size_t len) override;
    // Inflating data that stops before the end of the zlib stream is an error.
    DELTAPDF_DLL
    void finish() override;

    // Compression level for every deflating Pl_Flate created afterwards: 1 (fastest) to 9
    // (smallest), or -1 for zlib's default.
    DELTAPDF_DLL
    static void setCompressionLevel(int);
    DELTAPDF_DLL
    static int getCompressionLevel();

  private:
    DELTAPDF_DLL_PRIVATE
    void start();
    DELTAPDF_DLL_PRIVATE
    void run(int flush);
    DELTAPDF_DLL_PRIVATE
    void drain();
    DELTAPDF_DLL_PRIVATE
    void end();
    DELTAPDF_DLL_PRIVATE
    void check(char const* step, int status);

    DELTAPDF_DLL_PRIVATE
    static int compression_level;

    class DELTAPDF_DLL_PRIVATE Members
    {
        friend class Pl_Flate;

      public:
        Members(size_t out_bufsize, action_e action);
        ~Members();
        Members(Members const&) = delete;

      private:
        std::unique_ptr<z_stream_s> zs;
        std::vector<unsigned char> outbuf;
        action_e action;
        bool started{false};
        bool stream_end{false};
        bool received{false};
        bool finished{false};
    };

    std::unique_ptr<Members> m;
};

#endif // PL_FLATE_HH
