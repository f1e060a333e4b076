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

#ifndef PL_RUNLENGTH_HH
#define PL_RUNLENGTH_HH

#include <deltapdf/Pipeline.hh>

#include <string>

// /RunLengthDecode encoder and decoder. A length byte n in 0..127 is followed by n + 1 literal
// bytes; n in 129..255 is followed by one byte repeated 257 - n times; 128 marks end of data.
class DELTAPDF_DLL_CLASS Pl_RunLength: public Pipeline
{
  public:
    enum action_e { a_encode, a_decode };

    DELTAPDF_DLL
    Pl_RunLength(char const* identifier, Pipeline* next, action_e action);
    DELTAPDF_DLL
    ~Pl_RunLength() override;

    DELTAPDF_DLL
    void write(unsigned char const* data, size_t len) override;
    DELTAPDF_DLL
    void finish() override;

  private:
    DELTAPDF_DLL_PRIVATE
    void encode(unsigned char const* data, size_t len);
    DELTAPDF_DLL_PRIVATE
    void decode(unsigned char const* data, size_t len);
    DELTAPDF_DLL_PRIVATE
    void flush_encode();

    enum state_e { st_top, st_copying, st_run, st_eod };

    action_e action;
    state_e state{st_top};
    // Pending literal bytes (encode) or the remaining count (decode)
    std::string buf;
    unsigned int length{0};
};

#endif // PL_RUNLENGTH_HH
