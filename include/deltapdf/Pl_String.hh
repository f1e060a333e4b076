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

#ifndef PL_STRING_HH
#define PL_STRING_HH

#include <deltapdf/Pipeline.hh>

#include <string>

// This pipeline appends the data passed to it to a std::string, a reference to which is passed in
// at construction. "next" may be null; if given, data and finish() are passed through to it.
class DELTAPDF_DLL_CLASS Pl_String: public Pipeline
{
  public:
    DELTAPDF_DLL
    Pl_String(char const* identifier, Pipeline* next, std::string& s);
    DELTAPDF_DLL
    ~Pl_String() override;

    DELTAPDF_DLL
    void write(unsigned char const* buf, size_t len) override;
    DELTAPDF_DLL
    void finish() override;

  private:
    std::string& s;
};

#endif // PL_STRING_HH
