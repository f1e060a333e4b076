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

#ifndef DPDFTOKENIZER_HH
#define DPDFTOKENIZER_HH

#include <deltapdf/DLL.h>

#include <deltapdf/InputSource.hh>

#include <cstdio>
#include <memory>
#include <string>

namespace deltapdf
{
    class Tokenizer;
} // namespace deltapdf

class DPDFTokenizer
{
  public:
    enum token_type_e {
        tt_bad,
        tt_array_close,
        tt_array_open,
        tt_dict_close,
        tt_dict_open,
        tt_integer,
        tt_name,
        tt_real,
        tt_string,
        tt_null,
        tt_bool,
        tt_word,
        tt_eof,
    };

    class Token
    {
      public:
        Token() :
            type(tt_bad)
        {
        }
        DELTAPDF_DLL
        Token(token_type_e type, std::string const& value);
        Token(
            token_type_e type,
            std::string const& value,
            std::string raw_value,
            std::string error_message,
            dpdf_offset_t offset = 0,
            bool hex = false) :
            type(type),
            value(value),
            raw_value(raw_value),
            error_message(error_message),
            offset(offset),
            hex(hex)
        {
        }
        token_type_e
        getType() const
        {
            return this->type;
        }
        // For names, the value is the decoded name including its leading "/". For strings, it is
        // the decoded byte sequence. For everything else, it is the same as the raw value.
        std::string const&
        getValue() const
        {
            return this->value;
        }
        std::string const&
        getRawValue() const
        {
            return this->raw_value;
        }
        std::string const&
        getErrorMessage() const
        {
            return this->error_message;
        }
        // Offset of the first character of the token in the input source
        dpdf_offset_t
        getOffset() const
        {
            return this->offset;
        }
        // True for a string token written as <...>
        bool
        isHexString() const
        {
            return this->type == tt_string && this->hex;
        }
        bool
        operator==(Token const& rhs) const
        {
            // Ignore fields other than type and value
            return (
                (this->type != tt_bad) && (this->type == rhs.type) && (this->value == rhs.value));
        }
        bool
        isInteger() const
        {
            return this->type == tt_integer;
        }
        bool
        isWord() const
        {
            return this->type == tt_word;
        }
        bool
        isWord(std::string const& value) const
        {
            return this->type == tt_word && this->value == value;
        }

      private:
        token_type_e type;
        std::string value;
        std::string raw_value;
        std::string error_message;
        dpdf_offset_t offset{0};
        bool hex{false};
    };

    DELTAPDF_DLL
    DPDFTokenizer();

    DELTAPDF_DLL
    ~DPDFTokenizer();

    // Read a token from an input source. Context describes the context in which the token is being
    // read and is used in the exception thrown if there is an error. After a token is read, the
    // position of the input source returned by input.tell() points to just after the token, and the
    // input source's "last offset" as returned by input.getLastOffset() points to the beginning of
    // the token. Comments and whitespace are skipped. At the end of the input, a tt_eof token is
    // returned.
    //
    // If the token is bad, DPDFExc with error code dpdf_e_lex is thrown unless allow_bad is true,
    // in which case a tt_bad token is returned and its error message describes the problem.
    //
    // If max_len is not zero, a token longer than max_len characters is returned as bad. This is
    // useful when scanning data that is not known to be PDF syntax.
    DELTAPDF_DLL
    Token readToken(
        InputSource& input, std::string const& context, bool allow_bad = false, size_t max_len = 0);

    // Like readToken, but leave the input source where it was.
    DELTAPDF_DLL
    Token peekToken(InputSource& input, std::string const& context, bool allow_bad = false);

  private:
    DPDFTokenizer(DPDFTokenizer const&) = delete;
    DPDFTokenizer& operator=(DPDFTokenizer const&) = delete;

    std::unique_ptr<deltapdf::Tokenizer> m;
};

#endif // DPDFTOKENIZER_HH
