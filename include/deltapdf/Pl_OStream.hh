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

#ifndef PL_OSTREAM_HH
#define PL_OSTREAM_HH

#include <deltapdf/Pipeline.hh>

#include <iostream>

// End-of-line pipeline that writes to a std::ostream. finish() flushes the stream. The stream must
// outlive the pipeline.
class DELTAPDF_DLL_CLASS Pl_OStream: public Pipeline
{
  public:
    DELTAPDF_DLL
    Pl_OStream(char const* identifier, std::ostream& os);
    DELTAPDF_DLL
    ~Pl_OStream() override;

    DELTAPDF_DLL
    void write(unsigned char const* buf, size_t len) override;
    DELTAPDF_DLL
    void finish() override;

  private:
    std::ostream& os;
};

#endif // PL_OSTREAM_HH
