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

#ifndef DPDFOBJGEN_HH
#define DPDFOBJGEN_HH

#include <deltapdf/DLL.h>

#include <iostream>
#include <set>
#include <string>

// This class represents an object ID and generation pair. It is suitable to use as a key in a map
// or set. Two references with equal pairs denote the same object no matter which cross-reference
// section describes it.

class DPDFObjGen
{
  public:
    DPDFObjGen() = default;
    DPDFObjGen(int obj, int gen) :
        obj(obj),
        gen(gen)
    {
    }
    bool
    operator<(DPDFObjGen const& rhs) const
    {
        return (obj < rhs.obj) || (obj == rhs.obj && gen < rhs.gen);
    }
    bool
    operator==(DPDFObjGen const& rhs) const
    {
        return obj == rhs.obj && gen == rhs.gen;
    }
    bool
    operator!=(DPDFObjGen const& rhs) const
    {
        return !(*this == rhs);
    }
    int
    getObj() const
    {
        return obj;
    }
    int
    getGen() const
    {
        return gen;
    }
    bool
    isIndirect() const
    {
        return obj != 0;
    }
    std::string
    unparse(char separator = ',') const
    {
        return std::to_string(obj) + separator + std::to_string(gen);
    }
    friend std::ostream&
    operator<<(std::ostream& os, DPDFObjGen og)
    {
        os << og.obj << "," << og.gen;
        return os;
    }

    // Loop detection helper. add() returns false if og is already present; DPDFObjGen(0, 0) is
    // never stored.
    class DELTAPDF_DLL_CLASS set: public std::set<DPDFObjGen>
    {
      public:
        bool
        add(DPDFObjGen og)
        {
            if (og.isIndirect()) {
                if (count(og)) {
                    return false;
                }
                emplace(og);
            }
            return true;
        }

        void
        erase(DPDFObjGen og)
        {
            if (og.isIndirect()) {
                std::set<DPDFObjGen>::erase(og);
            }
        }
    };

  private:
    int obj{0};
    int gen{0};
};

#endif // DPDFOBJGEN_HH
