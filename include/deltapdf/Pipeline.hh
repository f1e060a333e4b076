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

// Generalized Pipeline interface. By convention, subclasses of Pipeline are called Pl_Something.
//
// When an instance of Pipeline is created with a pointer to a next pipeline, that pipeline writes
// its data to the next one when it finishes with it. The allocator of a pipeline is responsible
// for its destruction; one pipeline object does not manage the memory of its successor. This makes
// it possible to pass a pipeline to a function which sticks other pipelines in front of it.
//
// The client is required to call finish() before destroying a Pipeline in order to avoid loss of
// data. A Pipeline class should not throw an exception in the destructor if this hasn't been done.
//
// Stream decoding builds a chain of pipelines in reverse order, one per filter, ending in a
// Pl_String that collects the decoded bytes.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <deltapdf/DLL.h>

#include <memory>
#include <string>
#include <string_view>

// Remember to use DELTAPDF_DLL_CLASS on anything derived from Pipeline so it will work with
// dynamic_cast across the shared object boundary.
class DELTAPDF_DLL_CLASS Pipeline
{
  public:
    DELTAPDF_DLL
    Pipeline(char const* identifier, Pipeline* next);

    DELTAPDF_DLL
    virtual ~Pipeline() = default;

    // Subclasses should implement write and finish to do their jobs and then, if they are not
    // end-of-line pipelines, call getNext()->write or getNext()->finish.
    DELTAPDF_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    DELTAPDF_DLL
    virtual void finish() = 0;
    DELTAPDF_DLL
    std::string getIdentifier() const;

    // Convenience methods for writing other kinds of data without casting. The methods that take
    // char const* expect null-terminated C strings and do not write the null terminators.
    DELTAPDF_DLL
    void writeCStr(char const* cstr);
    DELTAPDF_DLL
    void writeString(std::string_view);
    // This allows *p << "x" << "y" but is not intended to be a general purpose << compatible with
    // ostream.
    DELTAPDF_DLL
    Pipeline& operator<<(char const* cstr);
    DELTAPDF_DLL
    Pipeline& operator<<(std::string const&);
    DELTAPDF_DLL
    Pipeline& operator<<(int);
    DELTAPDF_DLL
    Pipeline& operator<<(long);
    DELTAPDF_DLL
    Pipeline& operator<<(long long);
    DELTAPDF_DLL
    Pipeline& operator<<(unsigned int);
    DELTAPDF_DLL
    Pipeline& operator<<(unsigned long);
    DELTAPDF_DLL
    Pipeline& operator<<(unsigned long long);

    // Overloaded write to reduce casting
    DELTAPDF_DLL
    void write(char const* data, size_t len);

  protected:
    DELTAPDF_DLL
    Pipeline* getNext(bool allow_null = false);
    Pipeline*
    next() const
    {
        return next_;
    }
    std::string identifier;

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    Pipeline* next_;
};

#endif // PIPELINE_HH
