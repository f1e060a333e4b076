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

#ifndef BUFFERINPUTSOURCE_HH
#define BUFFERINPUTSOURCE_HH

#include <deltapdf/InputSource.hh>

#include <string_view>

// An input source over a block of memory. The contents are either shared with the creator through
// a shared_ptr or viewed without ownership, in which case the caller must keep them alive for the
// lifetime of the input source. Several input sources may read the same block concurrently since
// each keeps its own position.
class DELTAPDF_DLL_CLASS BufferInputSource: public InputSource
{
  public:
    DELTAPDF_DLL
    BufferInputSource(std::string const& description, std::shared_ptr<std::string const> contents);

    // The caller owns the memory.
    DELTAPDF_DLL
    BufferInputSource(std::string const& description, std::string_view contents);

    // Must be explicit and not inline -- see DELTAPDF_DLL_CLASS in DLL.h
    DELTAPDF_DLL
    ~BufferInputSource() override;
    DELTAPDF_DLL
    dpdf_offset_t findAndSkipNextEOL() override;
    DELTAPDF_DLL
    std::string const& getName() const override;
    DELTAPDF_DLL
    dpdf_offset_t tell() override;
    DELTAPDF_DLL
    void seek(dpdf_offset_t offset, int whence) override;
    DELTAPDF_DLL
    void rewind() override;
    DELTAPDF_DLL
    size_t read(char* buffer, size_t length) override;
    DELTAPDF_DLL
    void unreadCh(char ch) override;

    using InputSource::read;

  private:
    std::string description;
    std::shared_ptr<std::string const> owned;
    std::string_view view;
    dpdf_offset_t cur_offset{0};
    dpdf_offset_t max_offset{0};
};

#endif // BUFFERINPUTSOURCE_HH
