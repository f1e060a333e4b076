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

#ifndef DPDFLOGGER_HH
#define DPDFLOGGER_HH

#include <deltapdf/DLL.h>
#include <deltapdf/Pipeline.hh>

#include <iostream>
#include <memory>

class DPDFLogger
{
  public:
    DELTAPDF_DLL
    static std::shared_ptr<DPDFLogger> create();

    // Return the default logger. DPDF objects use it unless given their own with
    // DPDF::setLogger. A separate logger is useful when documents are processed on several
    // threads and their diagnostics should go to different places.
    DELTAPDF_DLL
    static std::shared_ptr<DPDFLogger> defaultLogger();

    // Defaults:
    //
    // info -- standard output
    // warn -- whatever error points to
    // error -- standard error
    //
    // "info" is used for diagnostic and progress messages. "warn" is used for recoverable
    // problems in the input, such as those found while reconstructing a damaged cross-reference
    // table. "error" is used for errors.
    //
    // On deletion, finish() is called for the standard output and standard error pipelines,
    // which flushes output. If you supply custom pipelines, you must call finish() on them
    // yourself. Calling finish is not needed for string or ostream pipelines.

    DELTAPDF_DLL
    void info(char const*);
    DELTAPDF_DLL
    void info(std::string const&);
    DELTAPDF_DLL
    std::shared_ptr<Pipeline> getInfo(bool null_okay = false);

    DELTAPDF_DLL
    void warn(char const*);
    DELTAPDF_DLL
    void warn(std::string const&);
    DELTAPDF_DLL
    std::shared_ptr<Pipeline> getWarn(bool null_okay = false);

    DELTAPDF_DLL
    void error(char const*);
    DELTAPDF_DLL
    void error(std::string const&);
    DELTAPDF_DLL
    std::shared_ptr<Pipeline> getError(bool null_okay = false);

    DELTAPDF_DLL
    std::shared_ptr<Pipeline> standardOutput();
    DELTAPDF_DLL
    std::shared_ptr<Pipeline> standardError();
    DELTAPDF_DLL
    std::shared_ptr<Pipeline> discard();

    // Passing a null pointer resets to default
    DELTAPDF_DLL
    void setInfo(std::shared_ptr<Pipeline>);
    DELTAPDF_DLL
    void setWarn(std::shared_ptr<Pipeline>);
    DELTAPDF_DLL
    void setError(std::shared_ptr<Pipeline>);

    // Shortcut for logic to reset output to new output/error streams. out_stream is used for
    // info, err_stream is used for error, and warning is cleared so that it follows error.
    DELTAPDF_DLL
    void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

  private:
    DPDFLogger();
    std::shared_ptr<Pipeline> throwIfNull(std::shared_ptr<Pipeline>, bool null_okay);

    class Members
    {
        friend class DPDFLogger;

      public:
        DELTAPDF_DLL
        ~Members();

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<Pipeline> p_discard;
        std::shared_ptr<Pipeline> p_stdout;
        std::shared_ptr<Pipeline> p_stderr;
        std::shared_ptr<Pipeline> p_info;
        std::shared_ptr<Pipeline> p_warn;
        std::shared_ptr<Pipeline> p_error;
    };
    std::shared_ptr<Members> m;
};

#endif // DPDFLOGGER_HH
