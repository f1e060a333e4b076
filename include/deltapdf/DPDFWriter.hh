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

#ifndef DPDFWRITER_HH
#define DPDFWRITER_HH

#include <deltapdf/Constants.h>
#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <deltapdf/DPDFObjectHandle.hh>

#include <memory>
#include <string>

// This class writes a complete PDF document from objects supplied by the caller. Objects are
// numbered in the order they are added, starting at 1, and are all written with generation 0. The
// writer keeps the handles it is given, so changes made to an added object before write() is
// called appear in the output. Handles returned by DPDF::getObject are shared with that DPDF's
// object cache; pass a shallowCopy() of one to avoid changing the source document.
//
// The file starts with a %PDF- header and a binary comment line, followed by the objects in number
// order, a cross-reference section, and the startxref offset. The cross-reference section is a
// classic table followed by a trailer dictionary, or a cross-reference stream whose dictionary
// carries the trailer keys. The trailer has /Size, /Root, /Info and /Encrypt when set, and an /ID
// of two equal strings made from an MD5 digest of the bytes before the cross-reference section.
class DPDFWriter
{
  public:
    DELTAPDF_DLL
    DPDFWriter();

    DELTAPDF_DLL
    ~DPDFWriter();

    // Return a writer holding a one-page document: a letter-size empty page, its page tree, a
    // catalog, and an info dictionary with /Producer and /CreationDate.
    DELTAPDF_DLL
    static std::shared_ptr<DPDFWriter> createMinimalDocument();

    // The version written in the header. The default is "1.7".
    DELTAPDF_DLL
    void setVersion(std::string const&);
    DELTAPDF_DLL
    std::string getVersion() const;

    // The default is dpdf_xref_table.
    DELTAPDF_DLL
    void setXrefFormat(dpdf_xref_format_e);

    // When compression is on, which is the default, streams without a /Filter key are written
    // compressed with /FlateDecode. Streams that already have a filter are written unchanged.
    DELTAPDF_DLL
    void setCompression(bool);

    // Set the zlib level used for compressed streams, from 0 to 9, or -1 for zlib's default.
    // Without this, the level set with Pl_Flate::setCompressionLevel is used. An out-of-range
    // level throws std::logic_error.
    DELTAPDF_DLL
    void setCompressionLevel(int);

    // Add an object and return an indirect reference to it.
    DELTAPDF_DLL
    DPDFObjectHandle addObject(DPDFObjectHandle const& obj);

    // Set /Type /Catalog in the catalog dictionary, add it, and make it the document's /Root.
    DELTAPDF_DLL
    DPDFObjectHandle setCatalog(DPDFObjectHandle catalog);

    // Add a dictionary and make it the document's /Info.
    DELTAPDF_DLL
    DPDFObjectHandle setInfo(DPDFObjectHandle const& info);

    // Add an encryption dictionary and reference it from the trailer as /Encrypt. The writer does
    // not encrypt anything; strings and streams must already be encrypted.
    DELTAPDF_DLL
    DPDFObjectHandle setEncrypt(DPDFObjectHandle const& encrypt);

    // Return the object added with the given number, or a null object if there is none.
    DELTAPDF_DLL
    DPDFObjectHandle getObject(int objid) const;

    // Return the number the next added object will get.
    DELTAPDF_DLL
    int getNextObjectId() const;

    // Remove all objects and the catalog, info and encryption settings. The version, format and
    // compression settings are kept.
    DELTAPDF_DLL
    void reset();

    // Return the document. Throws std::logic_error if no catalog has been set.
    DELTAPDF_DLL
    std::string write();

    // Write the result of write() to the named file.
    DELTAPDF_DLL
    void writeFile(char const* filename);

  private:
    DPDFWriter(DPDFWriter const&) = delete;
    DPDFWriter& operator=(DPDFWriter const&) = delete;

    std::string serialize(DPDFObjectHandle const& obj) const;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // DPDFWRITER_HH
