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


#ifndef DUTIL_HH
#define DUTIL_HH

#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <string>
#include <string_view>

// Conversions and file access shared by the library. Number formatting never depends on the C
// locale, since the output ends up in PDF syntax.
namespace DUtil
{
    // A positive length pads on the left with zeroes and a negative length pads on the right with
    // spaces. Bases 8, 10 and 16 are supported; hex digits are lower case.
    DELTAPDF_DLL
    std::string int_to_string(long long, int length = 0);
    DELTAPDF_DLL
    std::string int_to_string_base(long long, int base, int length = 0);

    // Fixed-point with decimal_places digits (6 if not positive). Trailing zeroes and a trailing
    // decimal point are dropped unless trim_trailing_zeroes is false. Negative zero is "0".
    DELTAPDF_DLL
    std::string double_to_string(double, int decimal_places = 0, bool trim_trailing_zeroes = true);

    // Decimal conversion allowing leading white space and a sign. Out-of-range values throw
    // std::range_error.
    DELTAPDF_DLL
    long long string_to_ll(char const* str);
    DELTAPDF_DLL
    int string_to_int(char const* str);

    // Errors throw std::runtime_error naming the file and the system error.
    DELTAPDF_DLL
    std::string read_file_into_string(char const* filename);
    // The data goes to a temporary file beside the target, which is then renamed over it.
    DELTAPDF_DLL
    void write_string_to_file(char const* filename, std::string const& data);

    // Lower-case hex, two digits per byte.
    DELTAPDF_DLL
    std::string hex_encode(std::string_view);
}; // namespace DUtil

#endif // DUTIL_HH
