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


#ifndef DPDFEXC_HH
#define DPDFEXC_HH

#include <deltapdf/Constants.h>
#include <deltapdf/DLL.h>
#include <deltapdf/Types.h>

#include <stdexcept>
#include <string>

// DPDFExc is thrown for every problem found in PDF input and is also the type of recorded
// warnings. The error code places the problem in one of two groups: lexical errors
// (dpdf_e_lex), raised while splitting bytes into tokens, and parse errors (unexpected token,
// unexpected end of file, invalid object, invalid xref, corrupted file, unsupported feature),
// raised while building objects or cross-reference data out of tokens. The remaining codes cover
// I/O failures and internal errors.
//
// what() is "<filename> (<object>, offset <n>): <message>". Parts with no value are left out, so
// an exception with only a message has that message as its what().
class DELTAPDF_DLL_CLASS DPDFExc: public std::runtime_error
{
  public:
    // An offset of 0 means "no offset". Nothing the library reports is located at the first byte
    // of a file, which always holds the header.
    DELTAPDF_DLL
    DPDFExc(
        dpdf_error_code_e error_code,
        std::string const& filename,
        std::string const& object,
        dpdf_offset_t offset,
        std::string const& message);

    ~DPDFExc() noexcept override = default;

    DELTAPDF_DLL
    dpdf_error_code_e getErrorCode() const;
    DELTAPDF_DLL
    std::string const& getFilename() const;
    DELTAPDF_DLL
    std::string const& getObject() const;
    // 0 if the error has no location
    DELTAPDF_DLL
    dpdf_offset_t getFilePosition() const;
    DELTAPDF_DLL
    std::string const& getMessageDetail() const;

    DELTAPDF_DLL
    bool isLexError() const;
    // True for the codes that describe malformed structure above the token level.
    DELTAPDF_DLL
    bool isParseError() const;

    // A short fixed description of an error code, such as "unexpected token".
    DELTAPDF_DLL
    static char const* describe(dpdf_error_code_e);

  private:
    // No Members pointer: copying an exception should not allocate more than it has to.
    dpdf_error_code_e error_code;
    std::string filename;
    std::string object;
    dpdf_offset_t offset;
    std::string message;
};

#endif // DPDFEXC_HH
