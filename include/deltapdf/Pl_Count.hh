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

#ifndef PL_COUNT_HH
#define PL_COUNT_HH

#include <deltapdf/Pipeline.hh>
#include <deltapdf/Types.h>

// Counts the bytes passing through. The incremental writer uses the count as the offset of the
// next byte it writes. This pipeline is reusable; it is safe to call write() after finish().
class DELTAPDF_DLL_CLASS Pl_Count: public Pipeline
{
  public:
    DELTAPDF_DLL
    Pl_Count(char const* identifier, Pipeline* next, dpdf_offset_t initial_count = 0);
    DELTAPDF_DLL
    ~Pl_Count() override;
    DELTAPDF_DLL
    void write(unsigned char const*, size_t) override;
    DELTAPDF_DLL
    void finish() override;
    // Returns the initial count plus the number of bytes written
    DELTAPDF_DLL
    dpdf_offset_t getCount() const;
    // Returns the last character written, or '\0' if nothing has been written
    DELTAPDF_DLL
    unsigned char getLastChar() const;

  private:
    dpdf_offset_t count;
    unsigned char last_char{'\0'};
};

#endif // PL_COUNT_HH
