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

#ifndef DINTC_HH
#define DINTC_HH

#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

// Checked integer conversion. Each conversion throws std::range_error if the value does not fit in
// the target type. Offsets, sizes and object numbers read from PDF input pass through these before
// being used for arithmetic or indexing.

namespace DIntC // DIntC = deltapdf Integer Conversion
{
    template <typename To, typename From>
    inline To
    convert(From const& i)
    {
        static_assert(std::is_integral_v<From> && std::is_integral_v<To>);
        bool in_range = true;
        if constexpr (std::is_signed_v<From> == std::is_signed_v<To>) {
            in_range =
                (i >= std::numeric_limits<To>::min()) && (i <= std::numeric_limits<To>::max());
        } else if constexpr (std::is_signed_v<From>) {
            in_range = (i >= 0) &&
                (static_cast<std::make_unsigned_t<From>>(i) <= std::numeric_limits<To>::max());
        } else {
            in_range =
                (i <= static_cast<std::make_unsigned_t<To>>(std::numeric_limits<To>::max()));
        }
        if (!in_range) {
            throw std::range_error(
                "integer out of range converting " + std::to_string(i) + " from a " +
                std::to_string(sizeof(From)) + "-byte " +
                (std::is_signed_v<From> ? "signed" : "unsigned") + " type to a " +
                std::to_string(sizeof(To)) + "-byte " +
                (std::is_signed_v<To> ? "signed" : "unsigned") + " type");
        }
        return static_cast<To>(i);
    }

    template <typename T>
    inline int
    to_int(T const& i)
    {
        return convert<int>(i);
    }

    template <typename T>
    inline unsigned int
    to_uint(T const& i)
    {
        return convert<unsigned int>(i);
    }

    template <typename T>
    inline size_t
    to_size(T const& i)
    {
        return convert<size_t>(i);
    }

    template <typename T>
    inline dpdf_offset_t
    to_offset(T const& i)
    {
        return convert<dpdf_offset_t>(i);
    }

    template <typename T>
    inline long long
    to_longlong(T const& i)
    {
        return convert<long long>(i);
    }

    template <typename T>
    inline unsigned long
    to_ulong(T const& i)
    {
        return convert<unsigned long>(i);
    }

    // Throw std::range_error if cur + delta would overflow.
    template <typename T>
    void
    range_check(T const& cur, T const& delta)
    {
        if ((delta > 0) != (cur > 0)) {
            return;
        }
        if ((delta > 0) && ((std::numeric_limits<T>::max() - cur) < delta)) {
            throw std::range_error("adding " + std::to_string(delta) + " to " +
                                   std::to_string(cur) + " would cause an integer overflow");
        } else if ((delta < 0) && ((std::numeric_limits<T>::min() - cur) > delta)) {
            throw std::range_error("adding " + std::to_string(delta) + " to " +
                                   std::to_string(cur) + " would cause an integer underflow");
        }
    }
}; // namespace DIntC

#endif // DINTC_HH
