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

#ifndef INPUTSOURCE_HH
#define INPUTSOURCE_HH

#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <cstdio>
#include <memory>
#include <string>

// Remember to use DELTAPDF_DLL_CLASS on anything derived from InputSource so it will work with
// dynamic_cast across the shared object boundary.
class DELTAPDF_DLL_CLASS InputSource
{
  public:
    InputSource() = default;

    virtual ~InputSource() = default;

    class DELTAPDF_DLL_CLASS Finder
    {
      public:
        DELTAPDF_DLL
        Finder() = default;
        DELTAPDF_DLL
        virtual ~Finder() = default;
        virtual bool check() = 0;
    };

    DELTAPDF_DLL
    void setLastOffset(dpdf_offset_t);
    DELTAPDF_DLL
    dpdf_offset_t getLastOffset() const;
    DELTAPDF_DLL
    std::string readLine(size_t max_line_length);

    // Find first or last occurrence of a sequence of characters starting within the range defined
    // by offset and len such that, when the input source is positioned at the beginning of that
    // sequence, finder.check() returns true. If len is 0, the search proceeds until EOF. If a
    // qualifying pattern is found, these methods return true and leave the input source positioned
    // wherever check() left it at the end of the matching pattern.
    DELTAPDF_DLL
    bool findFirst(char const* start_chars, dpdf_offset_t offset, size_t len, Finder& finder);
    DELTAPDF_DLL
    bool findLast(char const* start_chars, dpdf_offset_t offset, size_t len, Finder& finder);

    virtual dpdf_offset_t findAndSkipNextEOL() = 0;
    virtual std::string const& getName() const = 0;
    virtual dpdf_offset_t tell() = 0;
    virtual void seek(dpdf_offset_t offset, int whence) = 0;
    virtual void rewind() = 0;
    virtual size_t read(char* buffer, size_t length) = 0;

    // Note: you can only unread the character you just read. The specific character is ignored by
    // some implementations, and the implementation doesn't check this. Use of unreadCh is
    // semantically equivalent to seek(-1, SEEK_CUR) but is much more efficient.
    virtual void unreadCh(char ch) = 0;

    // Read count bytes starting at `at`, or at the current position if at is negative.
    DELTAPDF_DLL
    std::string read(size_t count, dpdf_offset_t at = -1);

  protected:
    dpdf_offset_t last_offset{0};
};

#endif // INPUTSOURCE_HH
