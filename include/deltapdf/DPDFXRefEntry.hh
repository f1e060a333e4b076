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

#ifndef DPDFXREFENTRY_HH
#define DPDFXREFENTRY_HH

#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <string>

class DPDFXRefEntry
{
  public:
    // Type constants are from the ISO 32000 section "Cross-Reference Streams":
    // 0 = free entry; field 1 = next free object, field 2 = generation
    // 1 = "uncompressed"; field 1 = offset, field 2 = generation
    // 2 = "compressed"; field 1 = object stream number, field 2 = index

    // Create a type 0 "free" entry.
    DELTAPDF_DLL
    DPDFXRefEntry();
    DELTAPDF_DLL
    DPDFXRefEntry(int type, dpdf_offset_t field1, int field2);

    DELTAPDF_DLL
    int getType() const;
    bool
    isFree() const
    {
        return type == 0;
    }
    DELTAPDF_DLL
    dpdf_offset_t getOffset() const; // only for type 1
    DELTAPDF_DLL
    int getGeneration() const; // 0 for type 2
    DELTAPDF_DLL
    int getObjStreamNumber() const; // only for type 2
    DELTAPDF_DLL
    int getObjStreamIndex() const; // only for type 2

    // Entries are equal if they describe the same location, regardless of which kind of
    // cross-reference section they came from.
    DELTAPDF_DLL
    bool operator==(DPDFXRefEntry const& rhs) const;
    bool
    operator!=(DPDFXRefEntry const& rhs) const
    {
        return !(*this == rhs);
    }

    // Return a short description such as "1/1234/0", "2/50/3" or "0".
    DELTAPDF_DLL
    std::string unparse() const;

  private:
    int type{0};
    dpdf_offset_t field1{0};
    int field2{0};
};

#endif // DPDFXREFENTRY_HH
