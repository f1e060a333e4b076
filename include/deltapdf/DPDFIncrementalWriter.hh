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

#ifndef DPDFINCREMENTALWRITER_HH
#define DPDFINCREMENTALWRITER_HH

#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <deltapdf/DPDFObjectHandle.hh>

#include <map>
#include <memory>
#include <string>

class DPDF;

// This class appends an incremental update to a PDF file. The original bytes are never changed.
// Each changed or new object is written as a complete indirect object after the original data,
// followed by a cross-reference table that describes only those objects and a trailer whose /Prev
// points at the previous cross-reference section. Because the original bytes are untouched, a
// signature over any prefix of the original file remains valid after the update.
//
// All objects are written with generation 0. Replacing an object number that is in use replaces
// the object; using a number at or beyond DPDF::getNextObjectId() adds a new object.
//
// The whole update is built in memory. If serializing any part of it fails, an exception is thrown
// and nothing is returned or written.
class DPDFIncrementalWriter
{
  public:
    // Create a writer for the given document. The document must stay valid for the life of the
    // writer.
    DELTAPDF_DLL
    DPDFIncrementalWriter(DPDF& pdf);

    DELTAPDF_DLL
    ~DPDFIncrementalWriter();

    // Add an object to the update. The object's value is serialized with all direct values
    // written out; references inside it are written as references. Calling this again for the
    // same object number replaces the earlier value.
    DELTAPDF_DLL
    void replaceObject(int objid, DPDFObjectHandle const& value);

    // Add an object whose serialized value is already known. The bytes are written between
    // "objid 0 obj" and "endobj" unchanged.
    DELTAPDF_DLL
    void replaceObject(int objid, std::string const& serialized);

    // Return the number of objects in the update.
    DELTAPDF_DLL
    size_t getChangeCount() const;

    // If the prior trailer has an /ID, its second element is normally copied unchanged. With
    // this set, the second element is replaced with a digest of the first element, the appended
    // bytes and the previous startxref offset.
    DELTAPDF_DLL
    void setUpdateID(bool);

    // Return the original file followed by the update. With no changes, return the original.
    DELTAPDF_DLL
    std::string write();

    // Write the result of write() to the named file.
    DELTAPDF_DLL
    void writeFile(char const* filename);

    // Build an update without a DPDF. "changes" maps object numbers to serialized values,
    // "trailer" is the trailer of the newest section of the original, and "next_object_id" is
    // one past the highest object number the original uses. /Prev is taken from the last
    // startxref in the original.
    DELTAPDF_DLL
    static std::string writeUpdate(
        std::string const& original,
        std::map<int, std::string> const& changes,
        DPDFObjectHandle const& trailer,
        int next_object_id,
        bool update_id = false);

  private:
    DPDFIncrementalWriter(DPDFIncrementalWriter const&) = delete;
    DPDFIncrementalWriter& operator=(DPDFIncrementalWriter const&) = delete;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // DPDFINCREMENTALWRITER_HH
