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

#ifndef DPDF_HH
#define DPDF_HH

#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <deltapdf/DPDFExc.hh>
#include <deltapdf/DPDFObjGen.hh>
#include <deltapdf/DPDFObjectHandle.hh>
#include <deltapdf/DPDFXRefEntry.hh>
#include <deltapdf/InputSource.hh>

class BufferInputSource;
class DPDFLogger;
class DPDFParser;

class DPDF
{
  public:
    DELTAPDF_DLL
    DPDF();
    DELTAPDF_DLL
    ~DPDF();

    DELTAPDF_DLL
    static std::shared_ptr<DPDF> create();

    // Associate a file with a DPDF object and read its cross-reference data. Objects are not read
    // until they are needed. A DPDF object may be associated with only one file in its lifetime.
    // Parameters such as recovery and the logger must be set before calling a process method.
    DELTAPDF_DLL
    void processFile(char const* filename);

    // Parse a PDF file held in memory. The data is copied; description is used as the file name in
    // error messages.
    DELTAPDF_DLL
    void processMemoryFile(char const* description, char const* buf, size_t length);

    // Parameters

    // When recovery is enabled, a file whose cross-reference data cannot be read is repaired by
    // scanning it for objects, and some damaged stream lengths are tolerated. Each repair is
    // recorded as a warning. Recovery is off by default, in which case every error propagates.
    DELTAPDF_DLL
    void setAttemptRecovery(bool);

    // Don't write warnings to the logger. They are still available through getWarnings().
    DELTAPDF_DLL
    void setSuppressWarnings(bool);

    DELTAPDF_DLL
    void setLogger(std::shared_ptr<DPDFLogger>);
    DELTAPDF_DLL
    std::shared_ptr<DPDFLogger> getLogger();

    // Return the warnings issued so far and clear the list.
    DELTAPDF_DLL
    std::vector<DPDFExc> getWarnings();
    DELTAPDF_DLL
    bool anyWarnings() const;

    // Document information

    DELTAPDF_DLL
    std::string getFilename() const;
    // The version from the %PDF- header, such as "1.7"
    DELTAPDF_DLL
    std::string getPDFVersion() const;
    // The trailer of the newest cross-reference section
    DELTAPDF_DLL
    DPDFObjectHandle getTrailer();
    // The resolved /Root dictionary. Throws DPDFExc (dpdf_e_invalid_object) if it is not a
    // dictionary.
    DELTAPDF_DLL
    DPDFObjectHandle getRoot();
    DELTAPDF_DLL
    DPDFObjectHandle getCatalog();
    // The /Root value as it appears in the trailer
    DELTAPDF_DLL
    DPDFObjectHandle getRootReference();
    // The resolved /Info dictionary, or null if there isn't one
    DELTAPDF_DLL
    DPDFObjectHandle getInfo();
    DELTAPDF_DLL
    bool isEncrypted();
    DELTAPDF_DLL
    bool isLinearized();

    // Objects

    // Return the object with the given number and generation. The object is read on first use and
    // cached, so later calls return a handle to the same object. An object that is free, missing
    // from the cross-reference table, or whose generation does not match yields null. Changing the
    // returned handle with replaceKey, appendItem and the like changes the cached object for every
    // later caller; call shallowCopy() first to edit a private copy.
    DELTAPDF_DLL
    DPDFObjectHandle getObject(int objid, int generation);
    DELTAPDF_DLL
    DPDFObjectHandle getObject(DPDFObjGen og);

    // If the handle is a reference, return the object it refers to, following chains of
    // references. Otherwise return the handle itself. A chain that loops fails with DPDFExc
    // (dpdf_e_invalid_object).
    DELTAPDF_DLL
    DPDFObjectHandle resolve(DPDFObjectHandle oh);

    // Return a direct copy of the object with every reference inside it replaced by the object it
    // refers to. Objects that are reachable along more than one path are copied once per path. An
    // object that contains itself fails with DPDFExc (dpdf_e_invalid_object).
    DELTAPDF_DLL
    DPDFObjectHandle resolveAll(DPDFObjectHandle oh);

    // Return the leaf pages in document order. Each page is a copy of the page dictionary into
    // which /Resources, /MediaBox and /Rotate have been copied from the nearest ancestor that has
    // them, if the page lacks them. The copies keep the object number of the original page.
    DELTAPDF_DLL
    std::vector<DPDFObjectHandle> getAllPages();
    DELTAPDF_DLL
    int getPageCount();
    // Return the page at the zero-based index n from getAllPages(), or a null object if there is
    // no such page.
    DELTAPDF_DLL
    DPDFObjectHandle getPage(int n);
    // Return the decoded content of page n. When /Contents is an array, each stream in it is
    // followed by a newline and items that are not streams are skipped. A missing page or missing
    // /Contents gives an empty string.
    DELTAPDF_DLL
    std::string getPageContent(int n);

    // One past the highest object number in the cross-reference table, or 1 if it is empty
    DELTAPDF_DLL
    int getNextObjectId();

    // The merged cross-reference table, indexed by object number
    DELTAPDF_DLL
    std::map<int, DPDFXRefEntry> const& getXRefTable() const;
    // The trailer of each cross-reference section, newest first
    DELTAPDF_DLL
    std::vector<DPDFObjectHandle> getTrailers() const;
    // The offset of each cross-reference section, in the same order as getTrailers()
    DELTAPDF_DLL
    std::vector<dpdf_offset_t> getXRefSectionOffsets() const;
    // The offset given after the last startxref keyword
    DELTAPDF_DLL
    dpdf_offset_t getStartXRef() const;

    // Decode a stream's data, resolving /Filter and /DecodeParms first. The result is cached on the
    // stream.
    DELTAPDF_DLL
    std::string getStreamData(DPDFObjectHandle stream);

    // The original file contents
    DELTAPDF_DLL
    std::shared_ptr<std::string const> getBuffer() const;

  private:
    friend class DPDFParser;

    DPDF(DPDF const&) = delete;
    DPDF& operator=(DPDF const&) = delete;

    class Members;
    class PatternFinder;
    class ResolveRecorder;

    void processBuffer(std::string const& description, std::shared_ptr<std::string const> buffer);
    void parse();
    void warn(DPDFExc const& e);
    DPDFExc error(
        dpdf_error_code_e code,
        std::string const& object,
        dpdf_offset_t offset,
        std::string const& message);
    void checkProcessed() const;
    std::unique_ptr<BufferInputSource> newInput();

    // methods in DPDF_xref.cc
    bool findHeader(InputSource& input);
    bool findStartxref(InputSource& input);
    void read_xref(dpdf_offset_t xref_offset);
    void reconstruct_xref(DPDFExc& e);
    bool parse_xrefFirst(std::string const& line, int& obj, int& num, int& bytes);
    bool read_xrefEntry(InputSource& input, dpdf_offset_t& f1, int& f2, char& type);
    bool read_bad_xrefEntry(InputSource& input, dpdf_offset_t& f1, int& f2, char& type);
    dpdf_offset_t read_xrefTable(dpdf_offset_t section_offset, dpdf_offset_t xref_offset);
    dpdf_offset_t read_xrefStream(dpdf_offset_t xref_offset, bool record_section);
    dpdf_offset_t processXRefStream(
        dpdf_offset_t xref_offset, DPDFObjectHandle& xref_obj, bool record_section);
    std::pair<int, std::array<int, 3>>
    processXRefW(DPDFObjectHandle& dict, std::function<DPDFExc(std::string_view)> damaged);
    std::pair<int, std::vector<std::pair<int, int>>>
    processXRefIndex(DPDFObjectHandle& dict, std::function<DPDFExc(std::string_view)> damaged);
    void insertXrefEntry(int obj, int f0, dpdf_offset_t f1, int f2);
    void insertFreeXrefEntry(int obj, int gen);
    void addSection(dpdf_offset_t offset, DPDFObjectHandle trailer);
    void checkDeferredLengths();

    // methods in DPDF.cc
    DPDFObjectHandle readObjectAtOffset(
        bool try_recovery, dpdf_offset_t offset, std::string const& description, DPDFObjGen og);
    DPDFObjectHandle resolveObjGen(DPDFObjGen og);
    void resolveObjectsInStream(int obj_stream_number);
    DPDFObjectHandle resolveAllInternal(DPDFObjectHandle oh, DPDFObjGen::set& path);
    void getAllPagesInternal(
        DPDFObjectHandle node,
        std::map<std::string, DPDFObjectHandle> inherited,
        DPDFObjGen::set& visited,
        std::vector<DPDFObjectHandle>& result);

    // Used by DPDFParser while reading streams
    bool resolveStreamLength(DPDFObjectHandle const& ref, long long& length);
    void addDeferredLengthCheck(
        DPDFObjGen og, DPDFObjectHandle const& ref, size_t scanned, dpdf_offset_t offset);
    bool attemptRecovery() const;

    std::unique_ptr<Members> m;
};

#endif // DPDF_HH
